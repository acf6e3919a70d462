#pragma once
#include <atomic>
#include <memory>
#include "error/AppError.hpp"

// 작업 단위마다 하나씩 발급되는 취소 토큰 (stop() -> cancel())
class CancelToken {
public:
	void cancel() { cancelled_.store(true, std::memory_order_release); }
	bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

	// 취소되었으면 Cancelled 예외
	void throwIfCancelled() const {
		if (isCancelled()) throw AppError(ErrorCode::Cancelled);
	}

private:
	std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;
