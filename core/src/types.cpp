#include "cgats/types.hpp"
#include <cctype>

namespace cgats {

IndexOrder parseIndexOrder(const std::string& value) {
    std::string upper;
    upper.reserve(value.size());
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (upper == "STRIP_THEN_PATCH") return IndexOrder::STRIP_THEN_PATCH;
    if (upper == "PATCH_THEN_STRIP") return IndexOrder::PATCH_THEN_STRIP;
    return IndexOrder::UNKNOWN;
}

} // namespace cgats
