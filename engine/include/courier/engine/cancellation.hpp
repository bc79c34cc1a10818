#pragma once

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace courier {
namespace engine {

enum class CancelReason {
    none,
    user,
    timeout
};

/**
 * One-shot cancellation signal for a single dispatch.
 *
 * Two producers share it: the user (through TransactionRegistry::cancel)
 * and the dispatch deadline. The first reason wins. While a transfer is in
 * flight the token holds the libcurl multi handle and wakes its poll.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // false if the token was already cancelled
    bool cancel(CancelReason reason);

    bool is_cancelled() const;
    CancelReason reason() const;

    void attach(CURLM* multi);
    void detach();

private:
    mutable std::mutex mutex_;
    CancelReason reason_ = CancelReason::none;
    CURLM* multi_ = nullptr;
};

// transaction id -> token of the dispatch currently using it
class TransactionRegistry {
public:
    void add(const std::string& transaction_id, std::shared_ptr<CancellationToken> token);

    /**
     * Cancels and removes the entry. false when nothing is registered.
     * true means the signal was delivered; a transfer that finished in the
     * same instant still returns its result.
     */
    bool cancel(const std::string& transaction_id);

    // Removes the entry only while it still belongs to this token
    void clear(const std::string& transaction_id, const CancellationToken* token);

    bool contains(const std::string& transaction_id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CancellationToken>> tokens_;
};

} // namespace engine
} // namespace courier
