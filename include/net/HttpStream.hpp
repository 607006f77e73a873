#pragma once

#include "audio/ByteStream.hpp"
#include <curl/curl.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace kitsune::net {

/// HTTP GET body exposed as a ByteStream.
///
/// A worker thread runs the libcurl transfer and fills a bounded buffer; read()
/// drains it. open() returns once the response headers arrive and throws
/// audio::ConnectError on connection failure, timeout or a non-2xx status.
class HttpStream : public audio::ByteStream {
public:
    explicit HttpStream(std::string url,
                        std::chrono::seconds timeout = std::chrono::seconds(30),
                        size_t buffer_limit = 1 << 20);
    ~HttpStream() override;

    HttpStream(const HttpStream&) = delete;
    HttpStream& operator=(const HttpStream&) = delete;

    void open();

    long read(unsigned char* buffer, size_t size) override;
    void cancel() override;
    void close() override;
    bool failed() const override;
    long long content_length() const override;

    long status_code() const;

private:
    static size_t on_write(char* data, size_t size, size_t nmemb, void* userdata);
    static size_t on_header(char* data, size_t size, size_t nmemb, void* userdata);
    static int on_progress(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                           curl_off_t ultotal, curl_off_t ulnow);

    void transfer();

    std::string url_;
    std::chrono::seconds timeout_;
    size_t buffer_limit_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<unsigned char> buffer_;
    CURL* curl_ = nullptr;  // Owned by the worker
    bool headers_done_ = false;
    bool finished_ = false;
    bool cancelled_ = false;
    std::string error_;
    long status_ = 0;
    long long content_length_ = -1;

    std::jthread worker_;
};

// curl_global_init/curl_global_cleanup for the process. Create one in main
// before any transfer thread starts.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace kitsune::net
