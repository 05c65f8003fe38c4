#include "storage/csv_parser.hpp"

namespace tabula {

std::size_t parseCsvRecord(std::string_view record, char delimiter, std::vector<std::string>& fields) {
    std::size_t count = 0;

    auto nextField = [&]() -> std::string& {
        if (count == fields.size()) {
            fields.emplace_back();
        }
        std::string& field = fields[count++];
        field.clear();
        return field;
    };

    std::string* field = &nextField();
    bool inQuotes = false;

    for (std::size_t i = 0; i < record.size(); ++i) {
        char c = record[i];

        if (inQuotes) {
            if (c != '"') {
                field->push_back(c);
            } else if (i + 1 < record.size() && record[i + 1] == '"') {
                field->push_back('"');
                ++i;
            } else {
                inQuotes = false;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == delimiter) {
            field = &nextField();
        } else {
            field->push_back(c);
        }
    }

    fields.resize(count);
    return count;
}

}  // namespace tabula
