#include "courier/engine/cancellation.hpp"

namespace courier {
namespace engine {

bool CancellationToken::cancel(CancelReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reason_ != CancelReason::none || reason == CancelReason::none) {
        return false;
    }
    reason_ = reason;
    if (multi_ != nullptr) {
        curl_multi_wakeup(multi_);
    }
    return true;
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_ != CancelReason::none;
}

CancelReason CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

void CancellationToken::attach(CURLM* multi) {
    std::lock_guard<std::mutex> lock(mutex_);
    multi_ = multi;
}

void CancellationToken::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    multi_ = nullptr;
}

void TransactionRegistry::add(const std::string& transaction_id, std::shared_ptr<CancellationToken> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[transaction_id] = std::move(token);
}

bool TransactionRegistry::cancel(const std::string& transaction_id) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tokens_.find(transaction_id);
        if (it == tokens_.end()) {
            return false;
        }
        token = std::move(it->second);
        tokens_.erase(it);
    }
    token->cancel(CancelReason::user);
    return true;
}

void TransactionRegistry::clear(const std::string& transaction_id, const CancellationToken* token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(transaction_id);
    if (it != tokens_.end() && it->second.get() == token) {
        tokens_.erase(it);
    }
}

bool TransactionRegistry::contains(const std::string& transaction_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.count(transaction_id) > 0;
}

size_t TransactionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

} // namespace engine
} // namespace courier
