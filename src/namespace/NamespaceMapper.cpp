//
// Routes source namespaces to target namespaces
//

#include <algorithm>

#include <fmt/format.h>

#include "base/Errors.hpp"
#include "utils/StringUtil.hpp"

#include "NamespaceMapper.hpp"

namespace {
    const std::string ID_FIELD = "_id";

    void validateFieldScope(const std::string &source,
                            const oplogsync::config::NamespaceRule &rule,
                            const oplogsync::config::MappingConfig &config) {
        bool includes = !rule.includeFields.empty();
        bool excludes = !rule.excludeFields.empty();

        if ((includes && excludes) ||
            (includes && !config.excludeFields.empty()) ||
            (excludes && !config.includeFields.empty())) {
            throw oplogsync::ConfigurationError(fmt::format(
                "cannot mix include fields and exclude fields in namespace mapping for: '{}'", source
            ));
        }
    }

    void validateShape(const std::string &source, const std::string &target) {
        using oplogsync::routing::isWildcard;

        if (source.find('.') == std::string::npos || target.find('.') == std::string::npos) {
            throw oplogsync::ConfigurationError(fmt::format(
                "namespace mapping from '{}' to '{}' is invalid: namespaces must have the form 'database.collection'",
                source, target
            ));
        }

        if (isWildcard(source) != isWildcard(target)) {
            throw oplogsync::ConfigurationError(fmt::format(
                "namespace mapping from '{}' to '{}' is invalid: a '*' must appear in both "
                "the source and the target namespace, or in neither",
                source, target
            ));
        }
    }
}

namespace oplogsync::routing {
    NamespaceMapper::NamespaceMapper(const config::MappingConfig &mappingConfig):
        _logger(createLogger("NamespaceMapper")),
        _exclusions(RegexSet::fromNamespaces(mappingConfig.exclude)),
        _isPassthrough(true)
    {
        if (!mappingConfig.include.empty() && !mappingConfig.exclude.empty()) {
            throw ConfigurationError("included and excluded namespaces cannot be configured together");
        }

        if (!mappingConfig.includeFields.empty() && !mappingConfig.excludeFields.empty()) {
            throw ConfigurationError("global include fields and exclude fields cannot be configured together");
        }

        _defaultIncludeFields = normalizeIncludeFields(mappingConfig.includeFields);
        _defaultExcludeFields = normalizeExcludeFields(mappingConfig.excludeFields);

        std::set<std::string> mappedSources;

        for (const auto &[source, rule]: mappingConfig.mapping) {
            validateFieldScope(source, rule, mappingConfig);
            addMapping(source, rule);
            mappedSources.insert(source);
        }

        // included namespaces without an explicit rule map to themselves
        for (const auto &source: mappingConfig.include) {
            if (mappedSources.find(source) == mappedSources.end()) {
                addMapping(source, config::NamespaceRule{});
            }
        }

        _isPassthrough = _plain.empty() && _wildcard.empty();

        _logger->debug("{} plain / {} wildcard mappings, {} exclusions",
                       _plain.size(), _wildcard.size(), _exclusions.size());
    }

    void NamespaceMapper::addMapping(const std::string &source, const config::NamespaceRule &rule) {
        const std::string target = rule.rename.value_or(source);
        validateShape(source, target);

        registerMapping(source, MappedNamespace(
            target,
            normalizeIncludeFields(rule.includeFields),
            normalizeExcludeFields(rule.excludeFields)
        ));
        registerCommandMapping(source, target);
    }

    void NamespaceMapper::registerMapping(const std::string &source, MappedNamespace mapped) {
        std::scoped_lock lock(_mutex);

        if (isWildcard(source)) {
            WildcardMapping entry {
                CompiledPattern(source),
                CompiledPattern(mapped.name()),
                std::move(mapped)
            };

            auto it = std::find_if(_wildcard.begin(), _wildcard.end(), [&source](const WildcardMapping &wildcard) {
                return wildcard.source.pattern() == source;
            });

            if (it != _wildcard.end()) {
                *it = std::move(entry);
            } else {
                _wildcard.push_back(std::move(entry));
            }
        } else {
            setPlainLocked(source, std::move(mapped), true);
        }

        _namespaces.insert(source);
    }

    void NamespaceMapper::registerCommandMapping(const std::string &source, const std::string &target) {
        const auto commandSource = fmt::format("{}.{}", utility::databaseName(source), COMMAND_COLLECTION);
        const auto commandTarget = fmt::format("{}.{}", utility::databaseName(target), COMMAND_COLLECTION);

        if (isWildcard(commandSource) != isWildcard(commandTarget)) {
            _logger->debug("no command namespace mapping derivable from '{}' -> '{}'", source, target);
            return;
        }

        registerMapping(commandSource, MappedNamespace(commandTarget));
    }

    const MappedNamespace &NamespaceMapper::setPlainLocked(const std::string &source, MappedNamespace mapped,
                                                           bool replaceExisting) {
        auto existing = _plain.find(source);
        if (existing != _plain.end() && !replaceExisting) {
            return existing->second;
        }

        auto reverseIt = _reversePlain.find(mapped.name());
        if (reverseIt != _reversePlain.end() && reverseIt->second != source) {
            throw ConfigurationError(fmt::format(
                "multiple namespaces cannot be combined into one target namespace. "
                "trying to map '{}' to '{}' but there already exists a mapping from '{}' to '{}'",
                source, mapped.name(), reverseIt->second, mapped.name()
            ));
        }

        if (existing != _plain.end()) {
            // the previous target keeps its reverse entry: its database already
            // belongs to this source database and must not be claimed by another one
            existing->second = std::move(mapped);
        } else {
            existing = _plain.emplace(source, std::move(mapped)).first;
        }

        const auto &targetName = existing->second.name();

        _reversePlain[targetName] = source;
        _dbFanout[utility::databaseName(source)].insert(utility::databaseName(targetName));

        return existing->second;
    }

    std::optional<MappedNamespace> NamespaceMapper::resolve(const std::string &sourceNamespace) {
        if (_exclusions.contains(sourceNamespace)) {
            return std::nullopt;
        }

        if (_isPassthrough) {
            return MappedNamespace(sourceNamespace);
        }

        std::scoped_lock lock(_mutex);

        auto it = _plain.find(sourceNamespace);
        if (it != _plain.end()) {
            return it->second;
        }

        for (const auto &wildcard: _wildcard) {
            auto captured = wildcard.source.capture(sourceNamespace);
            if (!captured.has_value()) {
                continue;
            }

            MappedNamespace learned(
                CompiledPattern::substitute(wildcard.mapped.name(), *captured),
                wildcard.mapped.includeFields(),
                wildcard.mapped.excludeFields()
            );

            const auto &result = setPlainLocked(sourceNamespace, std::move(learned), false);
            _logger->debug("learned mapping {} -> {} (from {})",
                           sourceNamespace, result.name(), wildcard.source.pattern());

            return result;
        }

        return std::nullopt;
    }

    std::optional<std::string> NamespaceMapper::mapNamespace(const std::string &sourceNamespace) {
        auto mapped = resolve(sourceNamespace);

        if (!mapped.has_value()) {
            return std::nullopt;
        }

        return mapped->name();
    }

    std::set<std::string> NamespaceMapper::mapDatabase(const std::string &sourceDatabase) {
        if (_isPassthrough) {
            return { sourceDatabase };
        }

        // seeds _dbFanout even if no collection of this database was seen yet
        resolve(fmt::format("{}.{}", sourceDatabase, COMMAND_COLLECTION));

        std::scoped_lock lock(_mutex);

        auto it = _dbFanout.find(sourceDatabase);
        if (it == _dbFanout.end()) {
            return {};
        }

        return it->second;
    }

    std::optional<std::string> NamespaceMapper::unmap(const std::string &targetNamespace) const {
        if (_isPassthrough) {
            return targetNamespace;
        }

        std::scoped_lock lock(_mutex);

        auto it = _reversePlain.find(targetNamespace);
        if (it != _reversePlain.end()) {
            return it->second;
        }

        for (const auto &wildcard: _wildcard) {
            auto captured = wildcard.target.capture(targetNamespace);
            if (!captured.has_value()) {
                continue;
            }

            return CompiledPattern::substitute(wildcard.source.pattern(), *captured);
        }

        return std::nullopt;
    }

    std::pair<std::optional<FieldSet>, std::optional<FieldSet>>
    NamespaceMapper::fields(const std::string &sourceNamespace) {
        auto mapped = resolve(sourceNamespace);

        if (!mapped.has_value()) {
            return { std::nullopt, std::nullopt };
        }

        return fieldsOf(*mapped);
    }

    std::pair<std::optional<FieldSet>, std::optional<FieldSet>>
    NamespaceMapper::fieldsOf(const MappedNamespace &mapped) const {
        if (mapped.hasFields()) {
            return { mapped.includeFields(), mapped.excludeFields() };
        }

        return { _defaultIncludeFields, _defaultExcludeFields };
    }

    std::optional<Projection> NamespaceMapper::projection(const std::string &sourceNamespace,
                                                          const std::optional<Projection> &callerProjection) {
        auto mapped = resolve(sourceNamespace);

        if (!mapped.has_value()) {
            return std::nullopt;
        }

        auto [includeFields, excludeFields] = fieldsOf(*mapped);
        const bool isInclude = includeFields.has_value();
        const auto &mandatoryFields = isInclude ? includeFields : excludeFields;

        if (!mandatoryFields.has_value()) {
            return callerProjection;
        }

        Projection fullProjection;
        for (const auto &field: *mandatoryFields) {
            fullProjection[field] = isInclude ? 1 : 0;
        }

        if (callerProjection.has_value()) {
            for (const auto &[field, value]: *callerProjection) {
                fullProjection[field] = value;
            }
        }

        return fullProjection;
    }

    const std::set<std::string> &NamespaceMapper::namespaces() const {
        return _namespaces;
    }

    bool NamespaceMapper::isPassthrough() const {
        return _isPassthrough;
    }

    std::optional<FieldSet> NamespaceMapper::normalizeIncludeFields(const std::vector<std::string> &fields) const {
        if (fields.empty()) {
            return std::nullopt;
        }

        FieldSet fieldSet(fields.begin(), fields.end());
        // the document key is always fetched
        fieldSet.insert(ID_FIELD);

        return fieldSet;
    }

    std::optional<FieldSet> NamespaceMapper::normalizeExcludeFields(const std::vector<std::string> &fields) const {
        FieldSet fieldSet(fields.begin(), fields.end());

        if (fieldSet.erase(ID_FIELD) > 0) {
            _logger->warn("'{}' cannot be excluded, ignoring it in the exclude fields", ID_FIELD);
        }

        if (fieldSet.empty()) {
            return std::nullopt;
        }

        return fieldSet;
    }
}
