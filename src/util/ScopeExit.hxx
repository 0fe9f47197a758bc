// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <utility>

/**
 * Internal class.  Do not use directly.
 */
template<typename F>
class ScopeExitGuard : F {
	bool enabled = true;

public:
	explicit ScopeExitGuard(F &&f) noexcept:F(std::forward<F>(f)) {}

	ScopeExitGuard(const ScopeExitGuard &) = delete;
	ScopeExitGuard &operator=(const ScopeExitGuard &) = delete;

	~ScopeExitGuard() noexcept {
		if (enabled)
			F::operator()();
	}

	void Cancel() noexcept {
		enabled = false;
	}
};

/**
 * Internal class.  Do not use directly.
 */
struct ScopeExitTag {
	template<typename F>
	ScopeExitGuard<F> operator+(F &&f) noexcept {
		return ScopeExitGuard<F>(std::forward<F>(f));
	}
};

#define ScopeExitCat(a, b) a ## b
#define ScopeExitName(line) ScopeExitCat(at_scope_exit_, line)

/**
 * Call the block right before the current scope is left, even when
 * an exception is thrown.
 *
 * Usage: AtScopeExit(&x) { free(x); };
 */
#define AtScopeExit(...) auto ScopeExitName(__LINE__) = ScopeExitTag{} + [__VA_ARGS__]() noexcept
