#pragma once
#include <string>
#include <vector>

namespace Trawl {
namespace Utils {
namespace Text {

class Converter {
public:
    static std::string              to_markdown(const std::string& html);
    static std::vector<std::string> extract_links(const std::string& html);
    // Text of the first <title> element, whitespace collapsed.
    static std::string extract_title(const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
