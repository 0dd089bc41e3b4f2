//  IPLD merkle-link documents: node model, path access, link index
//  and ordered token streaming
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stack>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// cpp-libp2p multiformats: base58btc codec and multihash parsing
#include <libp2p/multi/multibase_codec/codecs/base58.hpp>
#include <libp2p/multi/multihash.hpp>

namespace ipld {

  // Specialized version of the fkYAML basic_node template used when loading
  // documents. fkyaml::ordered_map keeps the lexical order of the input, so
  // the Node built from it carries the authored key order.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Reserved key of a merkle-link: { "/": "<multihash>" }
  inline const std::string LINK_KEY = "/";

  // Path string syntax used by parse_path() and get()
  inline constexpr char PATH_SEPARATOR = '/';
  inline constexpr char PATH_ESCAPE = '\\';

  // Default bound on document nesting accepted by walk() and the loaders
  inline constexpr std::size_t DEFAULT_MAX_DEPTH = 512;

  // Base class of everything thrown by this library
  class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // A link string that is absent or is not a valid base58 multihash
  class DecodeError : public Error {
  public:
    using Error::Error;
  };

  // A value accessed as a type it does not hold
  class TypeError : public Error {
  public:
    using Error::Error;
  };

  // A document nested deeper than the configured bound
  class DepthLimitError : public Error {
  public:
    using Error::Error;
  };

  class Value;
  class Link;

  // Opaque scalar payload (e.g. a CBOR byte string)
  struct Bytes {
    std::vector< std::uint8_t > data;

    bool operator==( const Bytes& other ) const { return data == other.data; }
    bool operator!=( const Bytes& other ) const { return data != other.data; }
  };

  // Tags follow the alternative order of Value::Storage
  enum class ValueType {
    Null, Boolean, Integer, Float, String, Bytes, Sequence, Mapping
  };

  inline const char* type_name( ValueType t );

  // One step of a path: a map key or a sequence position
  using PathSegment = std::variant< std::string, std::size_t >;
  using Path = std::vector< PathSegment >;

  // Result of a traversal callback. Errors never travel through this type;
  // callbacks report them by throwing.
  enum class Control { Continue, SkipSubtree, Abort };

  enum class TokenKind {
    StartMap, Key, EndMap, StartArray, Index, EndArray, Value
  };

  inline const char* token_name( TokenKind kind );

  // Key name for Key tokens, position for Index tokens, the scalar for
  // Value tokens, nothing for the structural tokens
  using TokenPayload = std::variant< std::monostate, std::string,
    std::size_t, const Value* >;

  // The path passed in is shared by the whole traversal and changes as
  // read() moves on. It is only valid for the duration of the call; copy it
  // to keep it.
  using ReadFun = std::function<
    Control( const Path& path, TokenKind kind, const TokenPayload& payload ) >;

  // How a completed read() ended. Both outcomes are successful.
  enum class ReadState { Completed, Aborted };

  // Document mapping: string keys to values. Entries keep insertion order,
  // which is incidental; equality ignores it and read() sorts keys.
  class Node {
  public:
    using value_type = std::pair< std::string, Value >;
    using container_type = std::vector< value_type >;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;

    Node() = default;
    Node( std::initializer_list< value_type > entries );

    std::size_t size() const;
    bool empty() const;
    bool contains( const std::string& key ) const;

    // nullptr when the key is absent
    const Value* find( const std::string& key ) const;
    Value* find( const std::string& key );

    // Throws std::out_of_range when the key is absent
    const Value& at( const std::string& key ) const;
    Value& at( const std::string& key );

    // Inserts a null value for a missing key
    Value& operator[]( const std::string& key );

    // Insert or replace
    void set( const std::string& key, Value value );
    bool erase( const std::string& key );

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Keys in byte-wise order
    std::vector< std::string > sorted_keys() const;

    // Convenience forms of ipld::get(), ipld::links() and ipld::read()
    std::optional< Value > get( const std::string& path ) const;
    std::map< std::string, Link > links() const;
    ReadState read( const ReadFun& fun ) const;

  private:
    container_type entries_;
    // Key -> position in entries_
    std::unordered_map< std::string, std::size_t > index_;
  };

  // Same key set and equal values; entry order is ignored
  inline bool operator==( const Node& a, const Node& b );
  inline bool operator!=( const Node& a, const Node& b );

  // A single document value. The alternatives are closed; traversal code
  // dispatches with visit() so every shape is handled explicitly.
  class Value {
  public:
    using Sequence = std::vector< Value >;
    using Storage = std::variant< std::nullptr_t, bool, std::int64_t, double,
      std::string, Bytes, Sequence, Node >;

    Value() : storage_( nullptr ) {}
    Value( std::nullptr_t ) : storage_( nullptr ) {}
    Value( bool b ) : storage_( b ) {}

    // Unsigned values above INT64_MAX throw TypeError
    template < typename T, std::enable_if_t< std::is_integral_v< T >
      && !std::is_same_v< T, bool >, int > = 0 >
    Value( T i ) : storage_( to_integer( i ) ) {}

    Value( double d ) : storage_( d ) {}
    Value( const char* s ) : storage_( std::string( s ) ) {}
    Value( std::string s ) : storage_( std::move( s ) ) {}
    Value( Bytes b ) : storage_( std::move( b ) ) {}
    Value( Sequence seq ) : storage_( std::move( seq ) ) {}
    Value( Node n ) : storage_( std::move( n ) ) {}

    ValueType type() const {
      return static_cast< ValueType >( storage_.index() );
    }

    bool is_null() const { return type() == ValueType::Null; }
    bool is_boolean() const { return type() == ValueType::Boolean; }
    bool is_integer() const { return type() == ValueType::Integer; }
    bool is_float_number() const { return type() == ValueType::Float; }
    bool is_string() const { return type() == ValueType::String; }
    bool is_bytes() const { return type() == ValueType::Bytes; }
    bool is_sequence() const { return type() == ValueType::Sequence; }
    bool is_mapping() const { return type() == ValueType::Mapping; }
    bool is_scalar() const { return !is_sequence() && !is_mapping(); }

    // Checked accessors; a shape mismatch throws TypeError
    bool as_boolean() const { return checked< bool >( ValueType::Boolean ); }
    std::int64_t as_integer() const {
      return checked< std::int64_t >( ValueType::Integer );
    }
    double as_float() const { return checked< double >( ValueType::Float ); }
    const std::string& as_string() const {
      return checked< std::string >( ValueType::String );
    }
    const Bytes& as_bytes() const { return checked< Bytes >( ValueType::Bytes ); }
    const Sequence& as_sequence() const {
      return checked< Sequence >( ValueType::Sequence );
    }
    Sequence& as_sequence() { return checked< Sequence >( ValueType::Sequence ); }
    const Node& as_mapping() const { return checked< Node >( ValueType::Mapping ); }
    Node& as_mapping() { return checked< Node >( ValueType::Mapping ); }

    template < typename Visitor >
    decltype( auto ) visit( Visitor&& vis ) const {
      return std::visit( std::forward< Visitor >( vis ), storage_ );
    }

    friend bool operator==( const Value& a, const Value& b ) {
      return a.storage_ == b.storage_;
    }
    friend bool operator!=( const Value& a, const Value& b ) {
      return !( a == b );
    }

  private:
    template < typename T >
    static std::int64_t to_integer( T i );

    template < typename T >
    const T& checked( ValueType expected ) const;

    template < typename T >
    T& checked( ValueType expected );

    Storage storage_;
  };

  inline std::optional< Link > link_cast( const Node& n );

  // Decoded multihash carried by a link string
  struct Multihash {
    std::uint64_t code = 0;
    std::vector< std::uint8_t > digest;
    // Full binary form: varint code, digest length, digest
    std::vector< std::uint8_t > bytes;
  };

  // A merkle-link. Represented like any other mapping,
  //
  //   { "/": "<multihash>" }
  //
  // but it must hold the "/" entry and nothing else. Properties that belong
  // with a link go in an enclosing mapping:
  //
  //   { "unixMode": "0755", "content": { "/": "Qm..." } }
  class Link {
  public:
    Link() = default;
    explicit Link( const std::string& cid );

    // The string stored under "/", or "" when absent or not a string
    std::string link_string() const;

    // Throws DecodeError for an empty or malformed link string
    Multihash hash() const;

    // Deep comparison. A valid link body is one scalar, so this is cheap.
    bool equal( const Link& other ) const { return node_ == other.node_; }

    const Node& node() const { return node_; }

    friend bool operator==( const Link& a, const Link& b ) { return a.equal( b ); }
    friend bool operator!=( const Link& a, const Link& b ) { return !a.equal( b ); }

  private:
    friend std::optional< Link > link_cast( const Node& n );

    explicit Link( Node n ) : node_( std::move( n ) ) {}

    Node node_;
  };

  // True iff the mapping has exactly one entry, under LINK_KEY, holding
  // a string. A mapping with sibling keys is not a link, although links may
  // still be nested beneath it.
  inline bool is_link( const Node& n );
  inline bool is_link( const Value& v );

  // Copy of the link when is_link() holds
  inline std::optional< Link > link_cast( const Value& v );

  // Split a path string on PATH_SEPARATOR. PATH_ESCAPE makes the following
  // character part of the current segment. Empty segments are dropped, so
  // "a//b" addresses the same value as "a/b".
  inline Path parse_path( const std::string& path );

  // Escape a raw key for use as one segment of a path string
  inline std::string escape_key( const std::string& key );

  // Raw (unescaped) join of a path, for display
  inline std::string path_to_string( const Path& path );

  // Resolve a path against a value. nullptr means no value: a missing key,
  // a bad or out-of-range index, or segments left over at a scalar. Links
  // met along the way are ordinary mappings.
  inline const Value* find( const Value& root, const Path& path );

  // Copying forms rooted at a Node; an empty path yields the node itself
  inline std::optional< Value > get( const Node& node, const Path& path );
  inline std::optional< Value > get( const Node& node, const std::string& path );

  // Visitor for walk(). `path` joins the raw keys (and sequence positions)
  // from the root with '/', and is empty for the root. `err` is null except
  // for a node beyond the depth bound, which is reported but not descended.
  using WalkFun = std::function< Control( const Node& root, const Node& current,
    const std::string& path, std::exception_ptr err ) >;

  // Depth-first visit of every mapping reachable from `root`, root first.
  // Any result other than Control::Continue ends the walk and is returned.
  inline Control walk( const Node& root, const WalkFun& visit,
    std::size_t max_depth = DEFAULT_MAX_DEPTH );

  // Every link in the document keyed by its walk() path. Key text is kept
  // verbatim (no escaping), so "a/b" may name either a["a/b"] or a["a"]["b"].
  inline std::map< std::string, Link > links( const Node& node,
    std::size_t max_depth = DEFAULT_MAX_DEPTH );

  // Pre-order token stream over the document. Map keys are emitted in
  // byte-wise order, sequence elements in stored order. The callback's
  // SkipSubtree drops the value after a Key/Index token or the children after
  // a StartMap/StartArray token (the End token still follows); Abort stops
  // everything. Exceptions thrown by the callback propagate. The node must
  // not be modified until read() returns.
  inline ReadState read( const Node& node, const ReadFun& fun );

  // fkYAML adapters used to load and display documents. The top level of a
  // loaded document must be a mapping.
  inline Value from_yaml( const ordered_node& n,
    std::size_t max_depth = DEFAULT_MAX_DEPTH );
  inline ordered_node to_yaml( const Value& v );
  inline Node parse_document( const std::string& text,
    std::size_t max_depth = DEFAULT_MAX_DEPTH );
  inline Node parse_document( std::istream& in,
    std::size_t max_depth = DEFAULT_MAX_DEPTH );

namespace internal {

  // Multiformats decoding is delegated to libp2p::multi, which reports
  // failures as outcome results; they surface here as DecodeError.
  inline Multihash decode_multihash( const std::string& b58 ) {
    auto raw = libp2p::multi::detail::decodeBase58( b58 );
    if ( !raw ) {
      throw DecodeError( "invalid base58: " + raw.error().message() );
    }

    auto mh = libp2p::multi::Multihash::createFromBytes( raw.value() );
    if ( !mh ) {
      throw DecodeError( "invalid multihash: " + mh.error().message() );
    }

    Multihash out;
    out.code = static_cast< std::uint64_t >( mh.value().getType() );
    const auto digest = mh.value().getHash();
    out.digest.assign( digest.begin(), digest.end() );
    const auto& buffer = mh.value().toBuffer();
    out.bytes.assign( buffer.begin(), buffer.end() );
    return out;
  }

  // Sequence positions are plain decimal digits with no sign or spaces
  inline std::optional< std::size_t > parse_index( const std::string& s ) {
    if ( s.empty() ) return std::nullopt;
    std::size_t value = 0;
    for ( char c : s ) {
      if ( c < '0' || c > '9' ) return std::nullopt;
      const std::size_t digit = static_cast< std::size_t >( c - '0' );
      if ( value > ( static_cast< std::size_t >( -1 ) - digit ) / 10 ) {
        return std::nullopt;
      }
      value = value * 10 + digit;
    }
    return value;
  }

  inline std::string segment_text( const PathSegment& seg ) {
    if ( const auto* key = std::get_if< std::string >( &seg ) ) return *key;
    return std::to_string( std::get< std::size_t >( seg ) );
  }

  // One resolution step. Index segments name map keys by their decimal
  // text; string segments name sequence positions when they are numeric.
  inline const Value* child_of( const Node& n, const PathSegment& seg ) {
    return n.find( segment_text( seg ) );
  }

  inline const Value* child_of( const Value::Sequence& seq,
    const PathSegment& seg )
  {
    std::optional< std::size_t > idx;
    if ( const auto* pos = std::get_if< std::size_t >( &seg ) ) {
      idx = *pos;
    } else {
      idx = parse_index( std::get< std::string >( seg ) );
    }
    if ( !idx || *idx >= seq.size() ) return nullptr;
    return &seq[ *idx ];
  }

  inline const Value* step( const Value& cur, const PathSegment& seg ) {
    return cur.visit( [&seg]( const auto& alt ) -> const Value* {
      using T = std::decay_t< decltype( alt ) >;
      if constexpr ( std::is_same_v< T, Node > ) {
        return child_of( alt, seg );
      } else if constexpr ( std::is_same_v< T, Value::Sequence > ) {
        return child_of( alt, seg );
      } else {
        // Scalars have no children
        return nullptr;
      }
    } );
  }

  inline const Value* descend( const Value* cur, Path::const_iterator first,
    Path::const_iterator last )
  {
    for ( ; cur && first != last; ++first ) cur = step( *cur, *first );
    return cur;
  }

  // Extend a walk() path by one raw segment
  inline std::string join_segment( const std::string& base,
    const std::string& seg )
  {
    if ( base.empty() ) return seg;
    return base + PATH_SEPARATOR + seg;
  }

  inline std::exception_ptr depth_error( const std::string& where,
    std::size_t max_depth )
  {
    std::ostringstream oss;
    oss << "document nesting exceeds " << max_depth << " levels at '"
      << where << "'";
    return std::make_exception_ptr( DepthLimitError( oss.str() ) );
  }

  // Shared state of one walk() call
  struct WalkContext {
    const Node& root;
    const WalkFun& visit;
    std::size_t max_depth;
  };

  inline Control walk_node( const WalkContext& ctx, const Node& curr,
    const std::string& path, std::size_t depth );

  // Mappings are visited; sequences are only passed through. `owner` is the
  // nearest enclosing mapping, reported if a sequence nests too deeply.
  inline Control walk_value( const WalkContext& ctx, const Node& owner,
    const Value& v, const std::string& path, std::size_t depth )
  {
    return v.visit( [&]( const auto& alt ) -> Control {
      using T = std::decay_t< decltype( alt ) >;
      if constexpr ( std::is_same_v< T, Node > ) {
        return walk_node( ctx, alt, path, depth );
      } else if constexpr ( std::is_same_v< T, Value::Sequence > ) {
        if ( depth > ctx.max_depth ) {
          return ctx.visit( ctx.root, owner, path,
            depth_error( path, ctx.max_depth ) );
        }
        for ( std::size_t i = 0; i < alt.size(); ++i ) {
          const Control c = walk_value( ctx, owner, alt[i],
            join_segment( path, std::to_string( i ) ), depth + 1 );
          if ( c != Control::Continue ) return c;
        }
        return Control::Continue;
      } else {
        return Control::Continue;
      }
    } );
  }

  inline Control walk_node( const WalkContext& ctx, const Node& curr,
    const std::string& path, std::size_t depth )
  {
    if ( depth > ctx.max_depth ) {
      // Reported to the visitor; Continue here means "skip it"
      return ctx.visit( ctx.root, curr, path,
        depth_error( path, ctx.max_depth ) );
    }

    const Control c = ctx.visit( ctx.root, curr, path, nullptr );
    if ( c != Control::Continue ) return c;

    for ( const auto& [key, child] : curr ) {
      const Control cc = walk_value( ctx, curr, child,
        join_segment( path, key ), depth + 1 );
      if ( cc != Control::Continue ) return cc;
    }
    return Control::Continue;
  }

  // An open container on the read() frame stack. Every frame except the
  // root's owns the last segment of the shared path while it is open.
  struct ReadFrame {
    const Node* map = nullptr;
    const Value::Sequence* seq = nullptr;
    std::vector< const Node::value_type* > entries; // sorted by key, maps only
    std::size_t next = 0;
    bool skip_children = false;

    std::size_t child_count() const {
      return map ? entries.size() : seq->size();
    }
  };

  // Entries of a mapping in byte-wise key order
  inline std::vector< const Node::value_type* > sorted_entries( const Node& n ) {
    std::vector< const Node::value_type* > out;
    out.reserve( n.size() );
    for ( const auto& entry : n ) out.push_back( &entry );
    std::sort( out.begin(), out.end(),
      []( const Node::value_type* a, const Node::value_type* b ) {
        return a->first < b->first;
      } );
    return out;
  }

  using ReadStack = std::stack< ReadFrame, std::vector< ReadFrame > >;

  inline bool open_map( const Node& n, const Path& path, ReadStack& stack,
    const ReadFun& fun )
  {
    const Control c = fun( path, TokenKind::StartMap, TokenPayload() );
    if ( c == Control::Abort ) return false;

    ReadFrame frame;
    frame.map = &n;
    frame.skip_children = ( c == Control::SkipSubtree );
    if ( !frame.skip_children ) frame.entries = sorted_entries( n );
    stack.push( std::move( frame ) );
    return true;
  }

  inline bool open_sequence( const Value::Sequence& seq, const Path& path,
    ReadStack& stack, const ReadFun& fun )
  {
    const Control c = fun( path, TokenKind::StartArray, TokenPayload() );
    if ( c == Control::Abort ) return false;

    ReadFrame frame;
    frame.seq = &seq;
    frame.skip_children = ( c == Control::SkipSubtree );
    stack.push( std::move( frame ) );
    return true;
  }

  // Start a value: containers push a frame, scalars emit their Value token.
  // Returns false when the callback aborted.
  inline bool open_value( const Value& v, const Path& path, ReadStack& stack,
    const ReadFun& fun )
  {
    return v.visit( [&]( const auto& alt ) -> bool {
      using T = std::decay_t< decltype( alt ) >;
      if constexpr ( std::is_same_v< T, Node > ) {
        return open_map( alt, path, stack, fun );
      } else if constexpr ( std::is_same_v< T, Value::Sequence > ) {
        return open_sequence( alt, path, stack, fun );
      } else {
        return fun( path, TokenKind::Value, TokenPayload( &v ) )
          != Control::Abort;
      }
    } );
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Mapping keys that are not strings (e.g. "1: x") keep their text form
  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );
    if ( n.is_null() ) return "null";

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  inline std::string hex_string( const std::vector< std::uint8_t >& data ) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string s;
    s.reserve( data.size() * 2 );
    for ( std::uint8_t b : data ) {
      s += DIGITS[ b >> 4 ];
      s += DIGITS[ b & 0x0f ];
    }
    return s;
  }

  inline Value from_yaml_at( const ordered_node& n, std::size_t depth,
    std::size_t max_depth, std::vector< std::string >& path )
  {
    if ( n.is_mapping() || n.is_sequence() ) {
      if ( depth > max_depth ) {
        std::ostringstream oss;
        oss << "document nesting exceeds " << max_depth << " levels at '";
        for ( std::size_t i = 0; i < path.size(); ++i ) {
          if ( i ) oss << PATH_SEPARATOR;
          oss << path[ i ];
        }
        oss << "'";
        throw DepthLimitError( oss.str() );
      }
    }

    if ( n.is_mapping() ) {
      Node out;
      for ( const auto& [mk, mv] : n.map_items() ) {
        const std::string key = to_string_any( mk );
        path.push_back( key );
        out.set( key, from_yaml_at( mv, depth + 1, max_depth, path ) );
        path.pop_back();
      }
      return out;
    }
    if ( n.is_sequence() ) {
      Value::Sequence out;
      out.reserve( n.size() );
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        path.push_back( std::to_string( i ) );
        out.push_back( from_yaml_at( n.at( i ), depth + 1, max_depth, path ) );
        path.pop_back();
      }
      return out;
    }
    if ( n.is_null() ) return nullptr;
    if ( n.is_boolean() ) return n.get_value< bool >();
    if ( n.is_integer() ) return to_native_checked< std::int64_t >( n );
    if ( n.is_float_number() ) return to_native_checked< double >( n );
    if ( n.is_string() ) return to_native_checked< std::string >( n );

    throw TypeError( "unsupported YAML node type" );
  }

} // namespace ipld::internal

} // namespace ipld

inline const char* ipld::type_name( ValueType t ) {
  switch ( t ) {
    case ValueType::Null: return "null";
    case ValueType::Boolean: return "boolean";
    case ValueType::Integer: return "integer";
    case ValueType::Float: return "float";
    case ValueType::String: return "string";
    case ValueType::Bytes: return "bytes";
    case ValueType::Sequence: return "sequence";
    case ValueType::Mapping: return "mapping";
  }
  return "unknown";
}

inline const char* ipld::token_name( TokenKind kind ) {
  switch ( kind ) {
    case TokenKind::StartMap: return "start_map";
    case TokenKind::Key: return "key";
    case TokenKind::EndMap: return "end_map";
    case TokenKind::StartArray: return "start_array";
    case TokenKind::Index: return "index";
    case TokenKind::EndArray: return "end_array";
    case TokenKind::Value: return "value";
  }
  return "unknown";
}

// Node member function definitions

inline ipld::Node::Node( std::initializer_list< value_type > entries ) {
  entries_.reserve( entries.size() );
  index_.reserve( entries.size() );
  // Repeated keys: the last one wins
  for ( const auto& [key, value] : entries ) this->set( key, value );
}

inline bool ipld::Node::contains( const std::string& key ) const {
  return this->find( key ) != nullptr;
}

inline const ipld::Value* ipld::Node::find( const std::string& key ) const {
  const auto it = index_.find( key );
  if ( it == index_.end() ) return nullptr;
  return &entries_[ it->second ].second;
}

inline ipld::Value* ipld::Node::find( const std::string& key ) {
  const auto it = index_.find( key );
  if ( it == index_.end() ) return nullptr;
  return &entries_[ it->second ].second;
}

inline const ipld::Value& ipld::Node::at( const std::string& key ) const {
  if ( const Value* v = this->find( key ) ) return *v;
  throw std::out_of_range( "no such key '" + key + "'" );
}

inline ipld::Value& ipld::Node::at( const std::string& key ) {
  if ( Value* v = this->find( key ) ) return *v;
  throw std::out_of_range( "no such key '" + key + "'" );
}

inline ipld::Value& ipld::Node::operator[]( const std::string& key ) {
  if ( Value* v = this->find( key ) ) return *v;
  index_.emplace( key, entries_.size() );
  entries_.emplace_back( key, Value() );
  return entries_.back().second;
}

inline void ipld::Node::set( const std::string& key, Value value ) {
  ( *this )[ key ] = std::move( value );
}

inline bool ipld::Node::erase( const std::string& key ) {
  const auto it = index_.find( key );
  if ( it == index_.end() ) return false;

  const std::size_t pos = it->second;
  index_.erase( it );
  entries_.erase( entries_.begin() + static_cast< std::ptrdiff_t >( pos ) );
  // Later entries moved down by one
  for ( std::size_t i = pos; i < entries_.size(); ++i ) {
    index_[ entries_[ i ].first ] = i;
  }
  return true;
}

inline std::vector< std::string > ipld::Node::sorted_keys() const {
  std::vector< std::string > keys;
  keys.reserve( entries_.size() );
  for ( const auto& entry : entries_ ) keys.push_back( entry.first );
  // std::string ordering compares characters as unsigned bytes
  std::sort( keys.begin(), keys.end() );
  return keys;
}

inline std::optional< ipld::Value > ipld::Node::get(
  const std::string& path ) const
{
  return ipld::get( *this, path );
}

inline std::map< std::string, ipld::Link > ipld::Node::links() const {
  return ipld::links( *this );
}

inline ipld::ReadState ipld::Node::read( const ReadFun& fun ) const {
  return ipld::read( *this, fun );
}

inline std::size_t ipld::Node::size() const {
  return entries_.size();
}

inline bool ipld::Node::empty() const {
  return entries_.empty();
}

inline bool ipld::operator==( const Node& a, const Node& b ) {
  if ( a.size() != b.size() ) return false;
  for ( const auto& [key, value] : a ) {
    const Value* other = b.find( key );
    if ( !other || *other != value ) return false;
  }
  return true;
}

inline bool ipld::operator!=( const Node& a, const Node& b ) {
  return !( a == b );
}

// Value member function definitions

template < typename T >
inline std::int64_t ipld::Value::to_integer( T i ) {
  if constexpr ( std::is_unsigned_v< T >
    && sizeof( T ) >= sizeof( std::int64_t ) )
  {
    if ( i > static_cast< T >( std::numeric_limits< std::int64_t >::max() ) ) {
      std::ostringstream oss;
      oss << "integer " << i << " does not fit in a signed 64-bit value";
      throw TypeError( oss.str() );
    }
  }
  return static_cast< std::int64_t >( i );
}

template < typename T >
inline const T& ipld::Value::checked( ValueType expected ) const {
  if ( const T* p = std::get_if< T >( &storage_ ) ) return *p;
  std::ostringstream oss;
  oss << "expected " << type_name( expected ) << " value, found "
    << type_name( this->type() );
  throw TypeError( oss.str() );
}

template < typename T >
inline T& ipld::Value::checked( ValueType expected ) {
  const Value& self = *this;
  return const_cast< T& >( self.checked< T >( expected ) );
}

// Link member function definitions

inline ipld::Link::Link( const std::string& cid ) {
  node_.set( LINK_KEY, Value( cid ) );
}

inline std::string ipld::Link::link_string() const {
  const Value* v = node_.find( LINK_KEY );
  if ( !v || !v->is_string() ) return std::string();
  return v->as_string();
}

inline ipld::Multihash ipld::Link::hash() const {
  const std::string s = this->link_string();
  if ( s.empty() ) throw DecodeError( "no hash in link" );
  try {
    return internal::decode_multihash( s );
  }
  catch ( const DecodeError& ex ) {
    std::ostringstream oss;
    oss << "invalid link '" << s << "': " << ex.what();
    throw DecodeError( oss.str() );
  }
}

// Link recognition

inline bool ipld::is_link( const Node& n ) {
  if ( n.size() != 1 ) return false;
  const Value* v = n.find( LINK_KEY );
  return v && v->is_string();
}

inline bool ipld::is_link( const Value& v ) {
  return v.is_mapping() && is_link( v.as_mapping() );
}

inline std::optional< ipld::Link > ipld::link_cast( const Node& n ) {
  if ( !is_link( n ) ) return std::nullopt;
  return Link( n );
}

inline std::optional< ipld::Link > ipld::link_cast( const Value& v ) {
  if ( !v.is_mapping() ) return std::nullopt;
  return link_cast( v.as_mapping() );
}

// Path resolution

inline ipld::Path ipld::parse_path( const std::string& path ) {
  Path segs;
  std::string cur;
  for ( std::size_t i = 0; i < path.size(); ++i ) {
    const char c = path[ i ];
    if ( c == PATH_ESCAPE && i + 1 < path.size() ) {
      cur += path[ ++i ];
      continue;
    }
    if ( c == PATH_SEPARATOR ) {
      if ( !cur.empty() ) segs.emplace_back( std::move( cur ) );
      cur.clear();
      continue;
    }
    // A trailing lone escape is kept literally
    cur += c;
  }
  if ( !cur.empty() ) segs.emplace_back( std::move( cur ) );
  return segs;
}

inline std::string ipld::escape_key( const std::string& key ) {
  std::string out;
  out.reserve( key.size() );
  for ( char c : key ) {
    if ( c == PATH_SEPARATOR || c == PATH_ESCAPE ) out += PATH_ESCAPE;
    out += c;
  }
  return out;
}

inline std::string ipld::path_to_string( const Path& path ) {
  std::string s;
  for ( std::size_t i = 0; i < path.size(); ++i ) {
    if ( i ) s += PATH_SEPARATOR;
    s += internal::segment_text( path[ i ] );
  }
  return s;
}

inline const ipld::Value* ipld::find( const Value& root, const Path& path ) {
  return internal::descend( &root, path.begin(), path.end() );
}

inline std::optional< ipld::Value > ipld::get( const Node& node,
  const Path& path )
{
  if ( path.empty() ) return Value( node );
  const Value* v = internal::descend( internal::child_of( node, path.front() ),
    path.begin() + 1, path.end() );
  if ( !v ) return std::nullopt;
  return *v;
}

inline std::optional< ipld::Value > ipld::get( const Node& node,
  const std::string& path )
{
  return get( node, parse_path( path ) );
}

// Link extraction

inline ipld::Control ipld::walk( const Node& root, const WalkFun& visit,
  std::size_t max_depth )
{
  const internal::WalkContext ctx{ root, visit, max_depth };
  return internal::walk_node( ctx, root, std::string(), 0 );
}

inline std::map< std::string, ipld::Link > ipld::links( const Node& node,
  std::size_t max_depth )
{
  std::map< std::string, Link > found;
  walk( node, [&found]( const Node&, const Node& curr,
    const std::string& path, std::exception_ptr err ) -> Control
  {
    // If anything went wrong, bail
    if ( err ) std::rethrow_exception( err );

    if ( auto l = link_cast( curr ) ) found[ path ] = std::move( *l );
    return Control::Continue;
  }, max_depth );
  return found;
}

// Token streaming. Runs on an explicit frame stack, so deeply nested
// documents cost heap memory rather than call stack. Frames point into the
// document, which must not be modified until read() returns.
inline ipld::ReadState ipld::read( const Node& node, const ReadFun& fun ) {
  internal::ReadStack stack;
  Path path;
  if ( !internal::open_map( node, path, stack, fun ) ) {
    return ReadState::Aborted;
  }

  while ( !stack.empty() ) {
    internal::ReadFrame& top = stack.top();

    if ( !top.skip_children && top.next < top.child_count() ) {
      const std::size_t i = top.next++;
      const Value* child = nullptr;
      Control c;

      if ( top.map ) {
        const Node::value_type& entry = *top.entries[ i ];
        c = fun( path, TokenKind::Key, TokenPayload( entry.first ) );
        child = &entry.second;
        if ( c == Control::Continue ) path.emplace_back( entry.first );
      } else {
        c = fun( path, TokenKind::Index, TokenPayload( i ) );
        child = &( *top.seq )[ i ];
        if ( c == Control::Continue ) path.emplace_back( i );
      }

      if ( c == Control::Abort ) return ReadState::Aborted;
      if ( c == Control::SkipSubtree ) continue;

      // May push onto the stack; `top` is not used past this point
      if ( !internal::open_value( *child, path, stack, fun ) ) {
        return ReadState::Aborted;
      }
      // Containers give their segment back when they close
      if ( child->is_scalar() ) path.pop_back();
      continue;
    }

    const TokenKind end = top.map ? TokenKind::EndMap : TokenKind::EndArray;
    stack.pop();
    if ( fun( path, end, TokenPayload() ) == Control::Abort ) {
      return ReadState::Aborted;
    }
    if ( !stack.empty() ) path.pop_back();
  }
  return ReadState::Completed;
}

// fkYAML adapters

inline ipld::Value ipld::from_yaml( const ordered_node& n,
  std::size_t max_depth )
{
  std::vector< std::string > path;
  return internal::from_yaml_at( n, 0, max_depth, path );
}

inline ipld::ordered_node ipld::to_yaml( const Value& v ) {
  return v.visit( []( const auto& alt ) -> ordered_node {
    using T = std::decay_t< decltype( alt ) >;
    if constexpr ( std::is_same_v< T, std::nullptr_t > ) {
      return ordered_node();
    } else if constexpr ( std::is_same_v< T, Bytes > ) {
      // YAML has no byte strings in this node type; show them as hex
      return internal::make_node_from( internal::hex_string( alt.data ) );
    } else if constexpr ( std::is_same_v< T, Value::Sequence > ) {
      std::vector< ordered_node > out;
      out.reserve( alt.size() );
      for ( const auto& el : alt ) out.push_back( to_yaml( el ) );
      return internal::make_node_from( out );
    } else if constexpr ( std::is_same_v< T, Node > ) {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [key, child] : alt ) out[ key ] = to_yaml( child );
      return out;
    } else {
      return internal::make_node_from( alt );
    }
  } );
}

inline ipld::Node ipld::parse_document( const std::string& text,
  std::size_t max_depth )
{
  const ordered_node dom = ordered_node::deserialize( text );
  Value doc = from_yaml( dom, max_depth );
  if ( !doc.is_mapping() ) {
    std::ostringstream oss;
    oss << "document root must be a mapping, found "
      << type_name( doc.type() );
    throw TypeError( oss.str() );
  }
  return std::move( doc.as_mapping() );
}

// Read from an input stream until end-of-file, then parse the whole text
inline ipld::Node ipld::parse_document( std::istream& in,
  std::size_t max_depth )
{
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_document( ss.str(), max_depth );
}
