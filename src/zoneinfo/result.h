// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <type_traits>
#include <utility>

#include "common/common_funcs.h"
#include "common/common_types.h"

/**
 * Identifies the module which raised an error. Results are propagated unchanged through a call
 * chain, so this need not be the module of the function that returned it.
 */
enum class ErrorModule : u32 {
    Tzif = 1,
    FS = 2,
};

/// A 32-bit error code made of a module and a module-specific description. Zero is success.
struct Result {
    u32 raw;

    static constexpr u32 ModuleBits = 9;
    static constexpr u32 DescriptionBits = 13;

    Result() = default;
    constexpr explicit Result(u32 raw_) : raw(raw_) {}

    constexpr Result(ErrorModule module_, u32 description_)
        : raw((static_cast<u32>(module_) & ((1U << ModuleBits) - 1)) |
              ((description_ & ((1U << DescriptionBits) - 1)) << ModuleBits)) {}

    [[nodiscard]] constexpr bool IsSuccess() const {
        return raw == 0;
    }

    [[nodiscard]] constexpr bool IsFailure() const {
        return !IsSuccess();
    }

    [[nodiscard]] constexpr ErrorModule GetModule() const {
        return static_cast<ErrorModule>(raw & ((1U << ModuleBits) - 1));
    }

    [[nodiscard]] constexpr u32 GetDescription() const {
        return (raw >> ModuleBits) & ((1U << DescriptionBits) - 1);
    }

    [[nodiscard]] constexpr bool operator==(const Result&) const = default;
};
static_assert(std::is_trivial_v<Result>);

constexpr Result ResultSuccess(0);

#define R_FAILED(res) (static_cast<Result>(res).IsFailure())

namespace ResultImpl {

/// Invokes a callback on destruction if the watched result holds a failure.
template <typename F>
class FailureGuard {
    ZONEINFO_NON_COPYABLE(FailureGuard);
    ZONEINFO_NON_MOVEABLE(FailureGuard);

public:
    constexpr FailureGuard(const Result& result, F callback)
        : m_result{result}, m_callback{std::move(callback)} {}

    ~FailureGuard() {
        if (R_FAILED(m_result)) {
            m_callback();
        }
    }

private:
    const Result& m_result;
    F m_callback;
};

struct FailureGuardBuilder {
    const Result& result;

    template <typename F>
    FailureGuard<std::decay_t<F>> operator+(F&& callback) const {
        return FailureGuard<std::decay_t<F>>(result, std::forward<F>(callback));
    }
};

/// Records the result being returned when the function has declared ON_RESULT_FAILURE.
constexpr void StoreResult(Result& current, Result result) {
    current = result;
}

/// Functions without ON_RESULT_FAILURE see the global constant, which is left alone.
constexpr void StoreResult(const Result&, Result) {}

} // namespace ResultImpl

constexpr inline Result ZoneinfoCurrentResult = ResultSuccess;

/**
 * Runs the following block when the enclosing function returns a failure through one of the R_
 * macros. At most one per scope.
 *
 *     ON_RESULT_FAILURE {
 *         LOG_ERROR(Tzif, "...");
 *     };
 */
#define ON_RESULT_FAILURE                                                                          \
    [[maybe_unused]] Result ZoneinfoCurrentResult = ResultSuccess;                                 \
    const auto CONCAT2(ZoneinfoResultGuard_, __COUNTER__) =                                        \
        ResultImpl::FailureGuardBuilder{ZoneinfoCurrentResult} + [&]()

/// Returns a result.
#define R_RETURN(res_expr)                                                                         \
    {                                                                                              \
        const Result _tmp_r_rc = (res_expr);                                                       \
        ResultImpl::StoreResult(ZoneinfoCurrentResult, _tmp_r_rc);                                 \
        return _tmp_r_rc;                                                                          \
    }

/// Returns ResultSuccess.
#define R_SUCCEED() R_RETURN(ResultSuccess)

/// Returns a failure.
#define R_THROW(res_expr) R_RETURN(res_expr)

/// Returns `res` unless `expr` holds.
#define R_UNLESS(expr, res)                                                                        \
    {                                                                                              \
        if (!(expr)) {                                                                             \
            R_THROW(res);                                                                          \
        }                                                                                          \
    }

/// Evaluates an expression returning a Result, and returns that result if it failed.
#define R_TRY(res_expr)                                                                            \
    {                                                                                              \
        const auto _tmp_r_try_rc = (res_expr);                                                     \
        if (R_FAILED(_tmp_r_try_rc)) {                                                             \
            R_THROW(_tmp_r_try_rc);                                                                \
        }                                                                                          \
    }

/// Returns success early if `expr` holds.
#define R_SUCCEED_IF(expr) R_UNLESS(!(expr), ResultSuccess)
