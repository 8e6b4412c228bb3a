//
// Resolved routing target of a source namespace
//

#ifndef OPLOGSYNC_NAMESPACE_MAPPEDNAMESPACE_HPP
#define OPLOGSYNC_NAMESPACE_MAPPEDNAMESPACE_HPP

#include <optional>
#include <set>
#include <string>

namespace oplogsync::routing {
    using FieldSet = std::set<std::string>;

    /**
     * target namespace name plus an optional field restriction.
     * at most one of includeFields / excludeFields is set.
     */
    class MappedNamespace {
    public:
        /**
         * @throws ConfigurationError if both field sets are given
         */
        explicit MappedNamespace(std::string name,
                                 std::optional<FieldSet> includeFields = std::nullopt,
                                 std::optional<FieldSet> excludeFields = std::nullopt);

        const std::string &name() const;
        const std::optional<FieldSet> &includeFields() const;
        const std::optional<FieldSet> &excludeFields() const;

        bool hasFields() const;

        bool operator==(const MappedNamespace &other) const;
        bool operator!=(const MappedNamespace &other) const;

    private:
        std::string _name;
        std::optional<FieldSet> _includeFields;
        std::optional<FieldSet> _excludeFields;
    };
}

#endif //OPLOGSYNC_NAMESPACE_MAPPEDNAMESPACE_HPP
