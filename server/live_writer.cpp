// ============================================================
// live_writer.cpp -- LiveWriter implementation
// ============================================================

#include "live_writer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

static const char* const DEFAULT_LIVE_NAME = "live.webm";
static const char* const DEFAULT_LIVE_MIME = "video/webm";

LiveWriter::LiveWriter(ArtifactCatalog& catalog)
    : catalog_(catalog)
{}

LiveWriter::~LiveWriter() {
    std::lock_guard<std::mutex> lk(map_mutex_);
    for (auto& kv : streams_) {
        std::lock_guard<std::mutex> slk(kv.second->mutex);
        close_stream(*kv.second);
    }
    streams_.clear();
}

LiveInitResult LiveWriter::init(const std::string& filename, const std::string& mime_type) {
    auto s = std::make_shared<LiveStream>();
    s->mime_type     = mime_type.empty() ? std::string(DEFAULT_LIVE_MIME) : mime_type;
    s->started_at_ms = utils::now_ms();

    std::string base = filename.find_first_not_of(" \t\r\n") == std::string::npos
        ? std::string(DEFAULT_LIVE_NAME) : filename;
    s->artifact_name = catalog_.allocate_name(base);

    try {
        s->writer.open(catalog_.path_for(s->artifact_name), file_io::FileWriter::Mode::APPEND);
    } catch (const std::runtime_error& e) {
        throw io_failure(std::string("Cannot open live artifact: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lk(map_mutex_);
        do {
            s->id = utils::generate_token();
        } while (streams_.count(s->id));
        streams_[s->id] = s;
    }

    LOG_INFO("Live stream " + s->id + " -> " + s->artifact_name + " (" + s->mime_type + ")");
    return LiveInitResult{s->id, s->artifact_name};
}

std::shared_ptr<LiveStream> LiveWriter::find(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lk(map_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        throw not_found("Unknown live stream: " + stream_id);
    }
    return it->second;
}

LiveAppendResult LiveWriter::append(const std::string& stream_id, const u8* data, size_t len) {
    if (!data) {
        throw invalid_argument("Live chunk has no data");
    }
    auto s = find(stream_id);

    std::lock_guard<std::mutex> lk(s->mutex);
    if (s->closed) {
        throw not_found("Unknown live stream: " + stream_id);
    }
    if (s->failed) {
        throw io_failure("Live stream " + stream_id + " failed earlier; finish it");
    }

    try {
        s->writer.write(data, len);
    } catch (const std::runtime_error& e) {
        s->failed = true;
        LOG_ERROR("Live stream " + stream_id + " append failed: " + e.what());
        throw io_failure(std::string("Live append failed: ") + e.what());
    }
    s->chunk_count   += 1;
    s->bytes_written += len;
    s->last_touch     = std::chrono::steady_clock::now();

    return LiveAppendResult{s->chunk_count, s->bytes_written};
}

LiveFinishResult LiveWriter::finish(const std::string& stream_id) {
    std::shared_ptr<LiveStream> s;
    {
        std::lock_guard<std::mutex> lk(map_mutex_);
        auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            throw not_found("Unknown live stream: " + stream_id);
        }
        s = it->second;
        streams_.erase(it);
    }

    std::lock_guard<std::mutex> lk(s->mutex);
    if (s->closed) {
        throw not_found("Unknown live stream: " + stream_id);
    }
    s->closed = true;
    try {
        s->writer.close();
    } catch (const std::runtime_error& e) {
        // Already out of the map: the stream is gone either way
        s->writer.abandon();
        LOG_ERROR("Live stream " + stream_id + " close failed: " + e.what());
        throw io_failure("Live artifact " + s->artifact_name + " is not durable: " + e.what());
    }
    if (s->failed) {
        LOG_WARN("Live stream " + stream_id + " finished after a failed append; " +
                 s->artifact_name + " holds " + std::to_string(s->chunk_count) + " chunks");
    } else {
        LOG_INFO("Live stream " + stream_id + " finished: " + s->artifact_name + " (" +
                 std::to_string(s->chunk_count) + " chunks, " +
                 utils::format_bytes(s->bytes_written) + ")");
    }
    return LiveFinishResult{s->artifact_name, s->bytes_written, s->chunk_count};
}

std::vector<std::string> LiveWriter::expire_idle(std::chrono::steady_clock::duration max_idle) {
    std::vector<std::string> expired;
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lk(map_mutex_);
    for (auto it = streams_.begin(); it != streams_.end(); ) {
        LiveStream& s = *it->second;
        std::unique_lock<std::mutex> slk(s.mutex, std::try_to_lock);
        if (!slk.owns_lock() || now - s.last_touch <= max_idle) {
            ++it;
            continue;
        }
        close_stream(s);
        LOG_INFO("Live stream " + it->first + " expired; kept partial " + s.artifact_name +
                 " (" + utils::format_bytes(s.bytes_written) + ")");
        expired.push_back(it->first);
        it = streams_.erase(it);
    }
    return expired;
}

size_t LiveWriter::size() const {
    std::lock_guard<std::mutex> lk(map_mutex_);
    return streams_.size();
}

// Caller holds s.mutex. Used where nobody waits for the result
// (expiry, shutdown), so a failed close is only logged.
void LiveWriter::close_stream(LiveStream& s) {
    if (s.closed) return;
    s.closed = true;
    try {
        s.writer.close();
    } catch (const std::runtime_error& e) {
        s.writer.abandon();
        LOG_ERROR("Live stream " + s.id + " close failed: " + e.what());
    }
}
