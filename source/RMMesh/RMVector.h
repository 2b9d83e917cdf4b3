#pragma once

#include "RMMeshFwd.h"
#include <cassert>
#include <initializer_list>
#include <vector>

namespace RM
{

/**
 * \brief std::vector<T>-like container that requires specific indexing type,
 * \tparam T type of stored elements
 * \tparam I type of index (shall be convertible to size_t)
 * \ingroup BasicGroup
 */
template <typename T, typename I>
class Vector
{
public:
    using value_type = typename std::vector<T>::value_type;
    using reference = typename std::vector<T>::reference;
    using const_reference = typename std::vector<T>::const_reference;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    /// creates empty vector
    Vector() = default;

    /// creates a vector with \p size elements with default value
    explicit Vector( size_t size ) : vec_( size ) { }

    /// creates a vector with \p size elements with the given value
    explicit Vector( size_t size, const T & val ) : vec_( size, val ) { }

    /// moves data from the given std::vector<T>
    Vector( std::vector<T> && vec ) : vec_( std::move( vec ) ) { }

    template< class InputIt >
    Vector( InputIt first, InputIt last ) : vec_( first, last ) { }

    Vector( std::initializer_list<T> init ) : vec_( init ) { }

    [[nodiscard]] bool operator == ( const Vector & b ) const { return vec_ == b.vec_; }
    [[nodiscard]] bool operator != ( const Vector & b ) const { return vec_ != b.vec_; }

    void clear() { vec_.clear(); }

    [[nodiscard]] bool empty() const { return vec_.empty(); }

    [[nodiscard]] std::size_t size() const { return vec_.size(); }

    void resize( size_t newSize ) { vec_.resize( newSize ); }
    void resize( size_t newSize, const T & t ) { vec_.resize( newSize, t ); }

    void reserve( size_t capacity ) { vec_.reserve( capacity ); }

    [[nodiscard]] const_reference operator[]( I i ) const
    {
        assert( size_t( i ) < vec_.size() );
        return vec_[i];
    }
    [[nodiscard]] reference operator[]( I i )
    {
        assert( size_t( i ) < vec_.size() );
        return vec_[i];
    }

    void push_back( const T & t ) { vec_.push_back( t ); }
    void push_back( T && t ) { vec_.push_back( std::move( t ) ); }

    template<typename... Args>
    T& emplace_back( Args&&... args ) { return vec_.emplace_back( std::forward<Args>(args)... ); }

    /// returns the identifier of the first element
    [[nodiscard]] I beginId() const { return I( size_t(0) ); }

    /// returns the number of elements as identifier
    [[nodiscard]] I endId() const { return I( vec_.size() ); }

    /// the user can directly manipulate the vector, anyway she cannot break anything
    std::vector<T> vec_;
};

template <typename T, typename I>
[[nodiscard]] inline auto begin( const Vector<T, I> & a )
    { return a.vec_.begin(); }

template <typename T, typename I>
[[nodiscard]] inline auto begin( Vector<T, I> & a )
    { return a.vec_.begin(); }

template <typename T, typename I>
[[nodiscard]] inline auto end( const Vector<T, I> & a )
    { return a.vec_.end(); }

template <typename T, typename I>
[[nodiscard]] inline auto end( Vector<T, I> & a )
    { return a.vec_.end(); }

/// given some Vector and a key, returns the value associated with the key, or default value if key is invalid or outside the Vector
template <typename T, typename I>
[[nodiscard]] inline T getAt( const Vector<T, I> & a, I id, T def = {} )
{
    return ( id && size_t( id ) < a.size() ) ? a[id] : def;
}

} // namespace RM
