//
// Resolved routing target of a source namespace
//

#include <fmt/format.h>

#include "base/Errors.hpp"

#include "MappedNamespace.hpp"

namespace oplogsync::routing {
    MappedNamespace::MappedNamespace(std::string name,
                                     std::optional<FieldSet> includeFields,
                                     std::optional<FieldSet> excludeFields):
        _name(std::move(name)),
        _includeFields(std::move(includeFields)),
        _excludeFields(std::move(excludeFields))
    {
        if (_includeFields.has_value() && _excludeFields.has_value()) {
            throw ConfigurationError(fmt::format(
                "cannot mix include fields and exclude fields in namespace mapping for: '{}'", _name
            ));
        }
    }

    const std::string &MappedNamespace::name() const {
        return _name;
    }

    const std::optional<FieldSet> &MappedNamespace::includeFields() const {
        return _includeFields;
    }

    const std::optional<FieldSet> &MappedNamespace::excludeFields() const {
        return _excludeFields;
    }

    bool MappedNamespace::hasFields() const {
        return _includeFields.has_value() || _excludeFields.has_value();
    }

    bool MappedNamespace::operator==(const MappedNamespace &other) const {
        return _name == other._name &&
               _includeFields == other._includeFields &&
               _excludeFields == other._excludeFields;
    }

    bool MappedNamespace::operator!=(const MappedNamespace &other) const {
        return !(*this == other);
    }
}
