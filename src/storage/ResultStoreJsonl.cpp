#include "storage/ResultStoreJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace stratbench {
namespace storage {

namespace {
std::uint64_t parseRecordId(const nlohmann::json& line) {
    return line.value("record_id", static_cast<std::uint64_t>(0));
}

std::string readExisting(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::string();
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();
    if (!content.empty() && content.back() != '\n') {
        content.push_back('\n');
    }
    return content;
}
}

ResultStoreJsonl::ResultStoreJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            last_record_id_ = (std::max)(last_record_id_, parseRecordId(nlohmann::json::parse(row)));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed result line in {}: {}", file_path_.string(), e.what());
        }
    }
}

bool ResultStoreJsonl::commitCycle(const std::vector<BacktestRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (records.empty()) {
        return true;
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create result directory {}: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    std::uint64_t next_id = last_record_id_;
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot open temp result file {}", tmp_path.string());
            return false;
        }

        // Whole-file copy: commit cost grows with the history kept in the store.
        out << readExisting(file_path_);
        for (const auto& record : records) {
            BacktestRecord stored = record;
            stored.record_id = ++next_id;
            out << toJson(stored).dump() << "\n";
        }

        out.flush();
        if (!out.good()) {
            LOG_ERROR("Write to temp result file {} failed", tmp_path.string());
            out.close();
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        LOG_ERROR("Commit of {} records to {} failed: {}", records.size(), file_path_.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }

    last_record_id_ = next_id;
    LOG_INFO("Committed {} records to {} (last id {})", records.size(), file_path_.string(), last_record_id_);
    return true;
}

std::vector<BacktestRecord> ResultStoreJsonl::loadAll() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<BacktestRecord> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            out.push_back(recordFromJson(nlohmann::json::parse(row)));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed result line in {}: {}", file_path_.string(), e.what());
        }
    }

    return out;
}

std::uint64_t ResultStoreJsonl::lastRecordId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_record_id_;
}

} // namespace storage
} // namespace stratbench
