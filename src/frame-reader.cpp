#include "frame-reader.hpp"

#include "log.hpp"
#include "process.hpp"

namespace toolwire {

FrameReader::FrameReader(Process * process, Correlator * correlator, size_t backlog_capacity)
    : process_(process), correlator_(correlator), backlog_capacity_(backlog_capacity) {
}

FrameReader::~FrameReader() {
    join();
}

void FrameReader::start() {
    reader_thread_ = std::thread(&FrameReader::run, this);
}

void FrameReader::join() {
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

void FrameReader::run() {
    std::string line;
    while (process_->read_line(line)) {
        if (line.empty()) {
            continue;
        }
        dispatch(line);
    }

    TOOLWIRE_LOG_DEBUG("%s: server stdout closed\n", __func__);
    correlator_->fail_all("Server connection closed");
}

bool FrameReader::dispatch(const std::string & line) {
    json message = json::parse(line, nullptr, /* allow_exceptions = */ false);
    if (message.is_discarded() || !message.is_object()) {
        TOOLWIRE_LOG_DEBUG("%s: discarding malformed line: %s\n", __func__, line.c_str());
        return false;
    }

    // a message with a method is a server-to-client request, its id is in the server's namespace
    const auto id = message.find("id");
    if (id != message.end() && id->is_number_integer() && !message.contains("method")) {
        if (correlator_->deliver(id->get<int64_t>(), message)) {
            return true;
        }
        TOOLWIRE_LOG_DEBUG("%s: no waiter for id=%s\n", __func__, id->dump().c_str());
    }

    push_backlog(std::move(message));
    return true;
}

void FrameReader::push_backlog(json message) {
    std::lock_guard<std::mutex> lock(backlog_mutex_);
    if (backlog_capacity_ == 0) {
        return;
    }
    while (backlog_.size() >= backlog_capacity_) {
        backlog_.pop_front();
    }
    backlog_.push_back(std::move(message));
}

size_t FrameReader::backlog_size() const {
    std::lock_guard<std::mutex> lock(backlog_mutex_);
    return backlog_.size();
}

std::vector<json> FrameReader::backlog() const {
    std::lock_guard<std::mutex> lock(backlog_mutex_);
    return std::vector<json>(backlog_.begin(), backlog_.end());
}

} // namespace toolwire
