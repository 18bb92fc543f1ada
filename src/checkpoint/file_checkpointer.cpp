// checkpoint/file_checkpointer.cpp
#include "graphflow/checkpoint/file_checkpointer.h"
#include "graphflow/common/errors.h"
#include "graphflow/common/logging.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace graphflow {

namespace {

// Thread ids are caller-chosen; anything outside [A-Za-z0-9_-] is %XX-escaped.
std::string encode_file_name(const ThreadId& thread_id) {
    std::ostringstream oss;
    for (unsigned char c : thread_id) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            oss << c;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace

FileCheckpointer::FileCheckpointer(std::filesystem::path directory)
    : FileCheckpointer(std::move(directory), Options{}) {}

FileCheckpointer::FileCheckpointer(std::filesystem::path directory, Options options)
    : directory_(std::move(directory)), options_(options) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw CheckpointError("Cannot create checkpoint directory '" + directory_.string() + "': " + ec.message());
    }
}

std::filesystem::path FileCheckpointer::file_for(const ThreadId& thread_id) const {
    return directory_ / (encode_file_name(thread_id) + ".json");
}

std::mutex& FileCheckpointer::lock_for(const ThreadId& thread_id) const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return thread_locks_[thread_id];
}

void FileCheckpointer::put(const Checkpoint& checkpoint) {
    if (checkpoint.thread_id.empty()) {
        throw CheckpointError("Checkpoint thread_id must not be empty");
    }
    if (checkpoint.checkpoint_id.empty()) {
        throw CheckpointError("Checkpoint id must not be empty");
    }

    std::lock_guard<std::mutex> lock(lock_for(checkpoint.thread_id));
    ThreadFile file = load(checkpoint.thread_id);

    auto it = std::find_if(file.checkpoints.begin(), file.checkpoints.end(), [&](const Checkpoint& c) {
        return c.checkpoint_id == checkpoint.checkpoint_id;
    });
    if (it != file.checkpoints.end()) {
        uint64_t sequence = it->sequence;
        *it = checkpoint;
        it->sequence = sequence;
    } else {
        Checkpoint stored = checkpoint;
        stored.sequence = ++file.next_sequence;
        file.checkpoints.push_back(std::move(stored));
    }

    if (options_.max_per_thread > 0 && file.checkpoints.size() > options_.max_per_thread) {
        auto excess = static_cast<std::ptrdiff_t>(file.checkpoints.size() - options_.max_per_thread);
        file.checkpoints.erase(file.checkpoints.begin(), file.checkpoints.begin() + excess);
    }
    store(checkpoint.thread_id, file);
}

std::optional<Checkpoint> FileCheckpointer::get(const ThreadId& thread_id,
                                                const std::optional<CheckpointId>& checkpoint_id) const {
    std::lock_guard<std::mutex> lock(lock_for(thread_id));
    ThreadFile file = load(thread_id);
    if (file.checkpoints.empty()) {
        return std::nullopt;
    }
    if (!checkpoint_id) {
        return file.checkpoints.back();
    }
    auto it = std::find_if(file.checkpoints.begin(), file.checkpoints.end(), [&](const Checkpoint& c) {
        return c.checkpoint_id == *checkpoint_id;
    });
    if (it == file.checkpoints.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Checkpoint> FileCheckpointer::list(const ThreadId& thread_id) const {
    std::lock_guard<std::mutex> lock(lock_for(thread_id));
    return load(thread_id).checkpoints;
}

FileCheckpointer::ThreadFile FileCheckpointer::load(const ThreadId& thread_id) const {
    ThreadFile file;
    std::filesystem::path path = file_for(thread_id);
    if (!std::filesystem::exists(path)) {
        return file;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw CheckpointError("Cannot open checkpoint file: " + path.string());
    }
    nlohmann::json doc;
    try {
        in >> doc;
        file.next_sequence = doc.value("next_sequence", uint64_t{0});
        for (const auto& entry : doc.at("checkpoints")) {
            file.checkpoints.push_back(entry.get<Checkpoint>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw CheckpointError("Corrupt checkpoint file " + path.string() + ": " + e.what());
    }

    std::sort(file.checkpoints.begin(), file.checkpoints.end(),
              [](const Checkpoint& a, const Checkpoint& b) { return a.sequence < b.sequence; });
    drop_expired(file.checkpoints);
    return file;
}

void FileCheckpointer::store(const ThreadId& thread_id, const ThreadFile& file) const {
    nlohmann::json doc{
        {"thread_id", thread_id},
        {"next_sequence", file.next_sequence},
        {"checkpoints", nlohmann::json::array()}
    };
    for (const auto& checkpoint : file.checkpoints) {
        doc["checkpoints"].push_back(checkpoint);
    }

    std::filesystem::path path = file_for(thread_id);
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw CheckpointError("Cannot write checkpoint file: " + tmp.string());
        }
        out << doc.dump(2);
        if (!out) {
            throw CheckpointError("Failed writing checkpoint file: " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw CheckpointError("Cannot replace checkpoint file " + path.string() + ": " + ec.message());
    }
}

void FileCheckpointer::drop_expired(std::vector<Checkpoint>& checkpoints) const {
    if (options_.ttl.count() <= 0) {
        return;
    }
    auto cutoff = std::chrono::system_clock::now() - options_.ttl;
    auto before = checkpoints.size();
    checkpoints.erase(std::remove_if(checkpoints.begin(), checkpoints.end(),
                                     [cutoff](const Checkpoint& c) { return c.timestamp < cutoff; }),
                      checkpoints.end());
    if (checkpoints.size() != before) {
        logger().debug("Dropped " + std::to_string(before - checkpoints.size()) + " expired checkpoint(s)");
    }
}

} // namespace graphflow
