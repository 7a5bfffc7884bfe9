#include "signature.hpp"

#include "../common/identifier.hpp"

#include <set>

namespace hatchet::catalog {

std::vector<std::string> signature_type_names(std::string_view text) {
    std::vector<std::string> names;
    std::set<std::string> seen;

    size_t i = 0;
    while (i < text.size()) {
        if (!is_identifier_start(text[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_identifier_char(text[i]))
            ++i;

        // 修飾名の後半（"::" の直後）は型名ではない
        bool qualified_tail = start >= 2 && text[start - 1] == ':' && text[start - 2] == ':';
        char first = text[start];
        if (qualified_tail || first < 'A' || first > 'Z')
            continue;

        std::string word(text.substr(start, i - start));
        if (seen.insert(word).second)
            names.push_back(std::move(word));
    }
    return names;
}

}  // namespace hatchet::catalog
