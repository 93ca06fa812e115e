#pragma once

#include "crimrag/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace crimrag {

/**
 * Conjunction of per-field membership predicates over DocumentMetadata.
 * A document matches when, for every constrained field, its rendered value
 * is one of the accepted values. Unknown field names match nothing.
 */
class MetadataFilter {
public:
    MetadataFilter() = default;

    MetadataFilter& require(const std::string& field, const std::string& value);
    MetadataFilter& require_any(const std::string& field, const std::vector<std::string>& values);

    bool matches(const DocumentMetadata& metadata) const;
    bool empty() const { return predicates_.empty(); }

    const std::map<std::string, std::set<std::string>>& predicates() const { return predicates_; }

    // "field=a|b, field2=c"
    std::string describe() const;

    // Parses "field=value" or "field=v1,v2". Throws InputError.
    static std::pair<std::string, std::vector<std::string>> parse_clause(const std::string& clause);

private:
    std::map<std::string, std::set<std::string>> predicates_;
};

} // namespace crimrag
