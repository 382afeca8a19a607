#pragma once

#include <optional>
#include <utility>

namespace SessionScope::dsp
{

//==============================================================================
/**
    Derived value with an explicit {Dirty, Clean(value)} state.

    markDirty() is called by every mutation that invalidates the value; the
    value is only (re)computed inside get(), or adopted ready-made through
    setClean() when a background task already produced it.
*/
template <typename ValueType>
class LazyValue
{
public:
    LazyValue() = default;

    void markDirty() noexcept             { value_.reset(); }
    bool isDirty() const noexcept         { return ! value_.has_value(); }

    void setClean (ValueType newValue)    { value_ = std::move (newValue); }

    template <typename ComputeFn>
    const ValueType& get (ComputeFn&& compute)
    {
        if (! value_.has_value())
            value_ = compute();

        return *value_;
    }

private:
    std::optional<ValueType> value_;
};

} // namespace SessionScope::dsp
