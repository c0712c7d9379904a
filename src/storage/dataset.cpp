#include "dataset.hpp"
#include <fstream>
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "../utils/text/encoding.hpp"

namespace Trawl {
namespace Storage {

Dataset::Dataset(const std::string& base_path, const std::string& name) {
    path_ = std::filesystem::path(base_path) / "datasets" / (name + ".jsonl");
    try {
        std::filesystem::create_directories(path_.parent_path());
        if (std::filesystem::exists(path_))
            count_ = read_items().size();
    } catch (const std::exception& e) {
        Trawl::Core::Logger::error("Dataset: failed to prepare " + path_.string() + ": " + e.what());
    }
}

void Dataset::push_data(const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open())
        throw std::runtime_error("Dataset: cannot open " + path_.string());

    if (data.is_array()) {
        for (const auto& item : data) {
            if (!item.is_object())
                throw std::invalid_argument("Dataset: records must be JSON objects");
        }
        for (const auto& item : data) {
            write_line(file, item);
        }
    }
    else {
        write_line(file, data);
    }

    file.flush();
    if (!file)
        throw std::runtime_error("Dataset: write error on " + path_.string());
}

void Dataset::write_line(std::ofstream& file, const nlohmann::json& item) {
    if (!item.is_object())
        throw std::invalid_argument("Dataset: records must be JSON objects");
    file << Utils::Text::dump_json(item) << '\n';
    ++count_;
}

std::vector<nlohmann::json> Dataset::read_items() const {
    std::vector<nlohmann::json> items;
    std::ifstream               file(path_);
    std::string                 line;
    while (std::getline(file, line)) {
        if (!line.empty())
            items.push_back(nlohmann::json::parse(line));
    }
    return items;
}

std::size_t Dataset::item_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

}  // namespace Storage
}  // namespace Trawl
