#pragma once

#include "RMMeshFwd.h"
#include <cstddef>
#include <type_traits>
#include <utility>

namespace RM
{

// stores index of some element, it is made as template class to avoid mixing faces and vertices
template <typename T>
class Id
{
public:
    using ValueType = int; //the type used for internal representation of Id

    constexpr Id() noexcept : id_( -1 ) { }

    // Allow constructing from `int` and other integral types,
    // but not from other `Id<U>` specializations, which themselves have implicit conversions to `int`.
    template <typename U, std::enable_if_t<std::is_integral_v<U>, std::nullptr_t> = nullptr>
    explicit constexpr Id( U i ) noexcept : id_( ValueType( i ) ) { }

    constexpr operator ValueType() const { return id_; }
    constexpr bool valid() const { return id_ >= 0; }
    explicit constexpr operator bool() const { return id_ >= 0; }
    constexpr ValueType & get() noexcept { return id_; }

    constexpr bool operator == (Id b) const { return id_ == b.id_; }
    constexpr bool operator != (Id b) const { return id_ != b.id_; }
    constexpr bool operator <  (Id b) const { return id_ <  b.id_; }

    template <typename U>
    bool operator == (Id<U> b) const = delete;
    template <typename U>
    bool operator != (Id<U> b) const = delete;
    template <typename U>
    bool operator < (Id<U> b) const = delete;

    constexpr Id & operator ++() { ++id_; return * this; }
    constexpr Id operator ++( int ) { auto res = *this; ++id_; return res; }

private:
    ValueType id_;
};

template <typename T>
inline constexpr Id<T> operator + ( Id<T> id, int a )          { return Id<T>{ id.get() + a }; }
template <typename T>
inline constexpr Id<T> operator + ( Id<T> id, unsigned int a ) { return Id<T>{ id.get() + a }; }
template <typename T>
inline constexpr Id<T> operator + ( Id<T> id, size_t a )       { return Id<T>{ id.get() + a }; }

inline constexpr FaceId operator ""_f( unsigned long long i ) noexcept { return FaceId{ (int)i }; }
inline constexpr VertId operator ""_v( unsigned long long i ) noexcept { return VertId{ (int)i }; }

} //namespace RM

template <typename T>
struct std::hash<RM::Id<T>>
{
    size_t operator() ( RM::Id<T> const& p ) const noexcept
    {
        return (int)p;
    }
};
