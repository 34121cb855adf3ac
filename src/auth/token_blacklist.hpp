#pragma once

// ---------------------------------------------------------------------------
// token_blacklist.hpp
//
// 폐기된 인증 토큰 해시 집합. 헤더 전용.
// 토큰 발급/검증 자체는 이 프로세스 밖의 책임이며, 여기서는 로그아웃 등으로
// 폐기된 토큰의 해시(원문 아님)만 보관한다.
//
// [스레드 안전성]
// - 게이트에서 유일하게 공유되는 가변 상태. std::shared_mutex 로 보호한다.
//   contains() 는 shared lock (동시 읽기), add() 는 unique lock.
//
// [알려진 한계]
// - 만료된 해시를 제거하지 않는다. 프로세스 수명 동안 단조 증가한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>

class TokenBlacklist {
public:
    TokenBlacklist()  = default;
    ~TokenBlacklist() = default;

    TokenBlacklist(const TokenBlacklist&)            = delete;
    TokenBlacklist& operator=(const TokenBlacklist&) = delete;

    [[nodiscard]] bool contains(std::string_view token_hash) const {
        std::shared_lock lock(mutex_);
        return hashes_.contains(std::string(token_hash));
    }

    // 새로 추가되었으면 true, 이미 있었으면 false.
    bool add(std::string token_hash) {
        std::unique_lock lock(mutex_);
        return hashes_.insert(std::move(token_hash)).second;
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(mutex_);
        return hashes_.size();
    }

private:
    mutable std::shared_mutex       mutex_;
    std::unordered_set<std::string> hashes_;
};
