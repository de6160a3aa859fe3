#include "report/Models.hpp"

namespace report {

int SourceTable::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) return static_cast<int>(i);
    }
    return -1;
}

const char* gender_str(Gender g) {
    switch (g) {
        case Gender::Male: return "Male";
        case Gender::Female: return "Female";
        default: return "unknown";
    }
}

bool StudentMetadata::set_field(const std::string& key, const std::string& value) {
    if (field(key)) return false;
    fields.emplace_back(key, value);
    return true;
}

const std::string* StudentMetadata::field(const std::string& key) const {
    for (const auto& kv : fields) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

}  // namespace report
