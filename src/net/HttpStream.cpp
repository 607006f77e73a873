#include "net/HttpStream.hpp"
#include "audio/PlaybackError.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace kitsune::net {

// Query strings carry credentials
static std::string redact(const std::string& url) {
    return url.substr(0, url.find('?'));
}

HttpStream::HttpStream(std::string url, std::chrono::seconds timeout, size_t buffer_limit)
    : url_(std::move(url)), timeout_(timeout), buffer_limit_(buffer_limit) {
}

HttpStream::~HttpStream() {
    close();
}

void HttpStream::open() {
    kitsune::util::Logger::debug("HttpStream: Opening " + redact(url_));

    worker_ = std::jthread([this] { transfer(); });

    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = cv_.wait_for(lock, timeout_, [this] {
        return headers_done_ || finished_ || cancelled_;
    });
    if (headers_done_) {
        kitsune::util::Logger::info("HttpStream: Connected (HTTP " + std::to_string(status_) +
                                    ", length=" + std::to_string(content_length_) + ")");
        return;
    }

    std::string reason;
    if (!ready) {
        reason = "timed out after " + std::to_string(timeout_.count()) + "s";
    } else if (cancelled_) {
        reason = "cancelled";
    } else if (!error_.empty()) {
        reason = error_;
    } else if (status_ != 0) {
        reason = "stream returned " + std::to_string(status_);
    } else {
        reason = "no response";
    }
    lock.unlock();

    close();
    kitsune::util::Logger::error("HttpStream: Open failed for " + redact(url_) + ": " + reason);
    throw audio::ConnectError("opening stream: " + reason);
}

void HttpStream::transfer() {
    CURL* curl = curl_easy_init();
    if (!curl) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            error_ = "curl_easy_init failed";
            finished_ = true;
        }
        cv_.notify_all();
        return;
    }
    curl_ = curl;

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &HttpStream::on_write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &HttpStream::on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &HttpStream::on_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    // A body that stops arriving for the whole timeout fails the transfer.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "kitsune/1.0");

    CURLcode res = curl_easy_perform(curl);

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        curl_ = nullptr;
        finished_ = true;
        if (code != 0) {
            status_ = code;
        }
        if (res != CURLE_OK && !cancelled_) {
            if (res == CURLE_HTTP_RETURNED_ERROR) {
                error_ = "stream returned " + std::to_string(code);
            } else {
                error_ = curl_easy_strerror(res);
            }
        }
    }
    cv_.notify_all();

    if (res != CURLE_OK && res != CURLE_ABORTED_BY_CALLBACK && res != CURLE_WRITE_ERROR) {
        kitsune::util::Logger::warn("HttpStream: Transfer ended: " + std::string(curl_easy_strerror(res)));
    }
    curl_easy_cleanup(curl);
}

size_t HttpStream::on_header(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<HttpStream*>(userdata);
    size_t len = size * nmemb;

    // A blank line closes one header block; redirects produce several
    bool end_of_block = (len == 2 && data[0] == '\r' && data[1] == '\n') || (len == 1 && data[0] == '\n');
    if (!end_of_block) {
        return len;
    }

    long code = 0;
    curl_easy_getinfo(self->curl_, CURLINFO_RESPONSE_CODE, &code);
    curl_off_t length = -1;
    curl_easy_getinfo(self->curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->status_ = code;
        if (code >= 200 && code < 300) {
            self->content_length_ = static_cast<long long>(length);
            self->headers_done_ = true;
        }
    }
    self->cv_.notify_all();
    return len;
}

size_t HttpStream::on_write(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<HttpStream*>(userdata);
    size_t len = size * nmemb;

    std::unique_lock<std::mutex> lock(self->mutex_);
    self->cv_.wait(lock, [self] {
        return self->buffer_.size() < self->buffer_limit_ || self->cancelled_;
    });
    if (self->cancelled_) {
        return 0;  // Aborts the transfer
    }

    self->headers_done_ = true;
    self->buffer_.insert(self->buffer_.end(), data, data + len);
    lock.unlock();
    self->cv_.notify_all();
    return len;
}

int HttpStream::on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<HttpStream*>(userdata);
    std::lock_guard<std::mutex> lock(self->mutex_);
    return self->cancelled_ ? 1 : 0;
}

long HttpStream::read(unsigned char* buffer, size_t size) {
    if (!buffer || size == 0) return 0;

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !buffer_.empty() || finished_ || cancelled_; });

    if (cancelled_) {
        return -1;
    }

    if (!buffer_.empty()) {
        size_t n = std::min(size, buffer_.size());
        std::copy_n(buffer_.begin(), n, buffer);
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<long>(n));
        lock.unlock();
        cv_.notify_all();
        return static_cast<long>(n);
    }

    return error_.empty() ? 0 : -1;
}

void HttpStream::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void HttpStream::close() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool HttpStream::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !error_.empty();
}

long long HttpStream::content_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return content_length_;
}

long HttpStream::status_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

CurlGlobal::CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

} // namespace kitsune::net
