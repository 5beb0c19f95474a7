#pragma once
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Raised when the transfer itself fails (no HTTP status available).
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(const std::string& what, bool timed_out, bool aborted)
        : std::runtime_error(what), timed_out_(timed_out), aborted_(aborted) {}

    bool timed_out() const { return timed_out_; }
    bool aborted() const { return aborted_; }

private:
    bool timed_out_;
    bool aborted_;
};

// abort_flag, when set, makes the transfer stop at the next progress callback.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000,
                            const std::vector<std::string>& extra_headers = {},
                            const std::atomic<bool>* abort_flag = nullptr);
