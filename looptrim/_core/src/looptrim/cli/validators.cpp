#include "validators.h"

#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace looptrim {
namespace cli {

Validator ExistingFile() {
    return Validator(
        [](const std::string& filename) -> std::string {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(filename, ec)) {
                return "File does not exist: " + filename;
            }
            return "";
        },
        "FILE(existing)");
}

Validator Range(double min, double max) {
    std::ostringstream desc;
    desc << "in [" << min << ", " << max << "]";
    return Validator(
        [min, max](const std::string& value) -> std::string {
            char* end = nullptr;
            double num = std::strtod(value.c_str(), &end);
            if (value.empty() || *end != '\0') {
                return "Not a valid number: " + value;
            }
            if (num < min || num > max) {
                std::ostringstream oss;
                oss << "Value " << value << " not in range [" << min << ", " << max << "]";
                return oss.str();
            }
            return "";
        },
        desc.str());
}

Validator ColonPair(const std::string& what) {
    return Validator(
        [what](const std::string& value) -> std::string {
            auto colon = value.find(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
                return "Expected " + what + " as A:B, got '" + value + "'";
            }
            return "";
        },
        what);
}

}  // namespace cli
}  // namespace looptrim
