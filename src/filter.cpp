#include "crimrag/filter.hpp"
#include "crimrag/error.hpp"

namespace crimrag {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

MetadataFilter& MetadataFilter::require(const std::string& field, const std::string& value) {
    return require_any(field, {value});
}

MetadataFilter& MetadataFilter::require_any(const std::string& field, const std::vector<std::string>& values) {
    CRIMRAG_CHECK_ARGUMENT(!field.empty(), "filter field name must not be empty");
    CRIMRAG_CHECK_ARGUMENT(!values.empty(), "filter on '" + field + "' needs at least one value");

    auto& accepted = predicates_[field];
    accepted.insert(values.begin(), values.end());
    return *this;
}

bool MetadataFilter::matches(const DocumentMetadata& metadata) const {
    for (const auto& [field, accepted] : predicates_) {
        const auto value = metadata.field(field);
        if (!value || accepted.count(*value) == 0) {
            return false;
        }
    }
    return true;
}

std::string MetadataFilter::describe() const {
    std::string out;
    for (const auto& [field, accepted] : predicates_) {
        if (!out.empty()) {
            out += ", ";
        }
        out += field + "=";
        bool first = true;
        for (const auto& value : accepted) {
            if (!first) {
                out += "|";
            }
            out += value;
            first = false;
        }
    }
    return out;
}

std::pair<std::string, std::vector<std::string>> MetadataFilter::parse_clause(const std::string& clause) {
    const auto eq = clause.find('=');
    if (eq == std::string::npos) {
        throw InputError("filter clause '" + clause + "' must look like field=value", "MetadataFilter::parse_clause");
    }

    std::string field = trim(clause.substr(0, eq));
    std::vector<std::string> values;
    std::string rest = clause.substr(eq + 1);
    std::size_t pos = 0;
    while (pos <= rest.size()) {
        const auto comma = rest.find(',', pos);
        const auto end = comma == std::string::npos ? rest.size() : comma;
        std::string value = trim(rest.substr(pos, end - pos));
        if (!value.empty()) {
            values.push_back(std::move(value));
        }
        if (comma == std::string::npos) {
            break;
        }
        pos = comma + 1;
    }

    if (field.empty() || values.empty()) {
        throw InputError("filter clause '" + clause + "' has an empty field or value", "MetadataFilter::parse_clause");
    }
    return {field, values};
}

} // namespace crimrag
