#pragma once
#include <filesystem>
#include <iosfwd>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Trawl {
namespace Storage {

// Append-only store of JSON records, one record per line in
// <base_path>/datasets/<name>.jsonl.
class Dataset {
public:
    explicit Dataset(const std::string& base_path, const std::string& name = "default");

    // An array is stored as one record per element. Throws on I/O failure.
    void push_data(const nlohmann::json& data);

    std::vector<nlohmann::json> read_items() const;
    std::size_t                 item_count() const;

    const std::filesystem::path& file_path() const {
        return path_;
    }

private:
    void write_line(std::ofstream& file, const nlohmann::json& item);

    std::filesystem::path path_;
    mutable std::mutex    mutex_;
    std::size_t           count_ = 0;
};

}  // namespace Storage
}  // namespace Trawl
