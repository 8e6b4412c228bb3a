//
// Routes source namespaces to target namespaces
//

#ifndef OPLOGSYNC_NAMESPACE_NAMESPACEMAPPER_HPP
#define OPLOGSYNC_NAMESPACE_NAMESPACEMAPPER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config/ConnectorConfig.hpp"
#include "utils/log.hpp"

#include "MappedNamespace.hpp"
#include "PatternCompiler.hpp"
#include "RegexSet.hpp"

namespace oplogsync::routing {
    /**
     * field name -> 1 (keep) / 0 (drop)
     */
    using Projection = std::map<std::string, int>;

    /**
     * resolves source namespaces ("db.collection") to their target namespace.
     *
     * plain mappings are looked up directly; wildcard mappings are matched in
     * registration order and the result is learned into the plain table, so a
     * namespace always resolves to the same target once it has been seen.
     * no two source namespaces may resolve to the same target.
     *
     * every method is safe to call from multiple threads.
     */
    class NamespaceMapper {
    public:
        static constexpr const char *COMMAND_COLLECTION = "$cmd";

        /**
         * @throws ConfigurationError on conflicting field scopes, malformed
         *         wildcards or two sources mapped to one target
         */
        explicit NamespaceMapper(const config::MappingConfig &mappingConfig = config::MappingConfig());

        /**
         * @return the target of `sourceNamespace`, or std::nullopt if it is not replicated
         * @throws ConfigurationError if a learned wildcard match collides with an existing target
         */
        std::optional<MappedNamespace> resolve(const std::string &sourceNamespace);

        std::optional<std::string> mapNamespace(const std::string &sourceNamespace);

        /**
         * every target database that data from `sourceDatabase` is routed to.
         * used to fan a dropDatabase out to all of them.
         */
        std::set<std::string> mapDatabase(const std::string &sourceDatabase);

        /**
         * reverse lookup; never learns.
         */
        std::optional<std::string> unmap(const std::string &targetNamespace) const;

        /**
         * (includeFields, excludeFields) in effect for `sourceNamespace`.
         * namespace-scoped fields take precedence over the global defaults.
         */
        std::pair<std::optional<FieldSet>, std::optional<FieldSet>> fields(const std::string &sourceNamespace);

        /**
         * merges `callerProjection` over the mandatory field projection of `sourceNamespace`.
         * the caller's entries win on collision.
         *
         * @return std::nullopt if the namespace is not replicated
         */
        std::optional<Projection> projection(const std::string &sourceNamespace,
                                             const std::optional<Projection> &callerProjection);

        /**
         * every source namespace or pattern registered at construction
         */
        const std::set<std::string> &namespaces() const;

        /**
         * true if no mapping was configured; every namespace maps to itself.
         */
        bool isPassthrough() const;

    private:
        struct WildcardMapping {
            CompiledPattern source;
            CompiledPattern target;
            MappedNamespace mapped;
        };

        void addMapping(const std::string &source, const config::NamespaceRule &rule);
        void registerMapping(const std::string &source, MappedNamespace mapped);
        void registerCommandMapping(const std::string &source, const std::string &target);

        /**
         * inserts source -> mapped into the plain table and its reverse index.
         * when `source` is already mapped and `replaceExisting` is false, the
         * existing entry is returned unchanged.
         *
         * _mutex must be held.
         */
        const MappedNamespace &setPlainLocked(const std::string &source, MappedNamespace mapped, bool replaceExisting);

        std::pair<std::optional<FieldSet>, std::optional<FieldSet>> fieldsOf(const MappedNamespace &mapped) const;

        std::optional<FieldSet> normalizeIncludeFields(const std::vector<std::string> &fields) const;
        std::optional<FieldSet> normalizeExcludeFields(const std::vector<std::string> &fields) const;

        LoggerPtr _logger;

        mutable std::mutex _mutex;

        std::unordered_map<std::string, MappedNamespace> _plain;
        std::vector<WildcardMapping> _wildcard;
        std::unordered_map<std::string, std::string> _reversePlain;
        std::unordered_map<std::string, std::set<std::string>> _dbFanout;

        RegexSet _exclusions;

        std::optional<FieldSet> _defaultIncludeFields;
        std::optional<FieldSet> _defaultExcludeFields;

        std::set<std::string> _namespaces;
        bool _isPassthrough;
    };
}

#endif //OPLOGSYNC_NAMESPACE_NAMESPACEMAPPER_HPP
