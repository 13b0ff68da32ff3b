// multidel
// Multi-source property delegation over YAML-valued objects
// version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace multidel {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map keeps mapping keys in insertion order, which is the
  // order reported by enumeration.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Builds a value node from any type fkYAML knows how to convert
  template < typename T >
  inline ordered_node make_node( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Failure categories. Each one aborts the current operation only.
  enum class ErrorKind {
    DuplicateProperty,
    MissingProperty,
    OverrideDisallowed,
    DeletionDisallowed,
    UnknownSource,
    UnknownOwnProperty,
    OperationNotAllowed,
    ProtectedOperation
  };

  inline const char* to_string( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::DuplicateProperty: return "DuplicateProperty";
      case ErrorKind::MissingProperty: return "MissingProperty";
      case ErrorKind::OverrideDisallowed: return "OverrideDisallowed";
      case ErrorKind::DeletionDisallowed: return "DeletionDisallowed";
      case ErrorKind::UnknownSource: return "UnknownSource";
      case ErrorKind::UnknownOwnProperty: return "UnknownOwnProperty";
      case ErrorKind::OperationNotAllowed: return "OperationNotAllowed";
      case ErrorKind::ProtectedOperation: return "ProtectedOperation";
    }
    return "Unknown";
  }

  class DelegationError : public std::runtime_error {
  public:
    inline DelegationError( ErrorKind kind, const std::string& what )
      : std::runtime_error( what ), kind_( kind ) {}

    inline ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
  };

  // Extension operations known to the registry. The first nine are eligible
  // for installation, the last four are protected.
  enum class Operation {
    Apply,
    Construct,
    DefineProperty,
    DeleteProperty,
    DescribeProperty,
    GetPrototype,
    IsExtensible,
    PreventExtensions,
    SetPrototype,
    Get,
    Set,
    Has,
    OwnKeys
  };

namespace internal {

  // Keys recognized in a policy configuration mapping
  inline const std::string ALLOW_DUPLICATE = "allow duplicate";
  inline const std::string ERROR_IF_MISSING = "error if missing";
  inline const std::string ALLOW_OVERRIDE = "allow override";
  inline const std::string ALLOW_DELETION = "allow deletion";

  // Operation name tables. delete_property is listed as eligible even though
  // erase() is a mandatory operation: the registry entry is an extension hook
  // only and never replaces Composite::erase(). The protected table is
  // authoritative.
  inline const std::vector< std::pair< Operation, std::string > >
    ELIGIBLE_OPERATIONS = {
      { Operation::Apply, "apply" },
      { Operation::Construct, "construct" },
      { Operation::DefineProperty, "define_property" },
      { Operation::DeleteProperty, "delete_property" },
      { Operation::DescribeProperty, "describe_property" },
      { Operation::GetPrototype, "get_prototype" },
      { Operation::IsExtensible, "is_extensible" },
      { Operation::PreventExtensions, "prevent_extensions" },
      { Operation::SetPrototype, "set_prototype" }
    };

  inline const std::vector< std::pair< Operation, std::string > >
    PROTECTED_OPERATIONS = {
      { Operation::Get, "get" },
      { Operation::Set, "set" },
      { Operation::Has, "has" },
      { Operation::OwnKeys, "own_keys" }
    };

  inline std::optional< Operation > lookup_operation(
    const std::vector< std::pair< Operation, std::string > >& table,
    const std::string& name )
  {
    for ( const auto& entry : table ) {
      if ( entry.second == name ) return entry.first;
    }
    return std::nullopt;
  }

  inline std::vector< std::string > operation_names(
    const std::vector< std::pair< Operation, std::string > >& table )
  {
    std::vector< std::string > out;
    out.reserve( table.size() );
    for ( const auto& entry : table ) out.push_back( entry.second );
    return out;
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Copy of a mapping with one key left out, order preserved
  inline ordered_node mapping_without( const ordered_node& m,
    const std::string& key )
  {
    ordered_node cleaned = ordered_node::mapping();
    for ( const auto& [mk, mv] : m.map_items() ) {
      const std::string k = mk.get_value< std::string >();
      if ( k == key ) continue;
      cleaned[ k ] = mv;
    }
    return cleaned;
  }

  // Prefixes the message with the kind name and throws
  [[noreturn]] inline void throw_error( ErrorKind kind,
    const std::string& msg )
  {
    std::ostringstream oss;
    oss << to_string( kind ) << ": " << msg;
    throw DelegationError( kind, oss.str() );
  }

} // namespace multidel::internal

  // Per-instance switches consulted by the resolution operations
  struct Policy {
    bool allow_duplicate = true;
    bool error_if_missing = false;
    bool allow_override = true;
    bool allow_deletion = false;

    // Reads a mapping such as
    //   allow duplicate: false
    //   error if missing: true
    // Absent keys keep their defaults.
    static Policy from_node( const ordered_node& config );
    static Policy from_yaml( const std::string& text );
  };

  // Anything a Composite can delegate to. A Composite never owns its
  // sources; each one must outlive every Composite that refers to it.
  class Source {
  public:
    virtual ~Source() = default;

    virtual bool has( const std::string& key ) const = 0;

    // std::nullopt when the key is absent
    virtual std::optional< ordered_node > get(
      const std::string& key ) const = 0;

    // Names of the entries this source exposes, in its own order
    virtual std::vector< std::string > keys() const = 0;

    // Returns whether an entry was removed
    virtual bool erase( const std::string& key ) = 0;
  };

  // Source backed by a YAML mapping node that it owns
  class NodeSource : public Source {
  public:
    explicit NodeSource( ordered_node mapping = ordered_node::mapping() );

    static NodeSource from_yaml( const std::string& text );

    bool has( const std::string& key ) const override;
    std::optional< ordered_node > get( const std::string& key ) const override;
    std::vector< std::string > keys() const override;
    bool erase( const std::string& key ) override;

    void set( const std::string& key, const ordered_node& value );

    inline const ordered_node& node() const { return mapping_; }

  private:
    ordered_node mapping_;
  };

  class Composite;

  // Extension callbacks kept beside the five mandatory operations. Names are
  // validated against the fixed eligible and protected tables.
  class OperationRegistry {
  public:
    using Callback
      = std::function< ordered_node( Composite&, const ordered_node& ) >;

    bool add( const std::string& name, Callback callback, bool silent = false );
    bool remove( const std::string& name, bool silent = true );

    // Installed callback or nullptr
    const Callback* find( const std::string& name ) const;

    std::vector< std::string > installed_names() const;

    static std::vector< std::string > eligible_names();
    static std::vector< std::string > protected_names();

  private:
    // Keyed by enum so listing follows the eligible table order
    std::map< Operation, Callback > callbacks_;
  };

  // The delegation unit: own storage checked first, then the ordered
  // sources. Being a Source itself, a Composite can back another Composite.
  // There is no cycle detection; a source graph that loops back on itself
  // recurses until the stack is exhausted.
  class Composite : public Source {
  public:
    explicit Composite( std::vector< Source* > sources = {},
      const Policy& policy = Policy() );

    Composite( std::vector< Source* > sources, bool allow_duplicate,
      bool error_if_missing = false, bool allow_override = true,
      bool allow_deletion = false );

    // Mandatory operations
    bool has( const std::string& key ) const override;
    std::optional< ordered_node > get( const std::string& key ) const override;
    void set( const std::string& key, const ordered_node& value );
    std::vector< std::string > keys() const override;
    bool erase( const std::string& key ) override;

    // Own storage
    void add_own_property( const std::string& key, const ordered_node& value );
    bool delete_own_property( const std::string& key, bool silent = true );
    bool has_own_property( const std::string& key ) const;
    inline const ordered_node& own_properties() const { return own_; }

    // Source list
    bool add_source( Source& source, bool put_upfront = false );
    bool remove_source( const Source& source, bool silent = true );
    bool is_source_in_hierarchy( const Source& source ) const;
    bool can_source_be_safely_added( const Source& source ) const;
    bool add_source_if_safe( Source& source );

    // Live list. Writing to it directly bypasses the uniqueness check done
    // by add_source().
    inline std::vector< Source* >& immediate_sources() { return sources_; }
    inline const std::vector< Source* >& immediate_sources() const {
      return sources_;
    }

    // Policy flags
    inline const Policy& policy() const { return policy_; }
    inline void set_policy( const Policy& policy ) { policy_ = policy; }

    inline bool allow_duplicate() const { return policy_.allow_duplicate; }
    inline void set_allow_duplicate( bool v ) { policy_.allow_duplicate = v; }
    inline bool error_if_missing() const { return policy_.error_if_missing; }
    inline void set_error_if_missing( bool v ) { policy_.error_if_missing = v; }
    inline bool allow_override() const { return policy_.allow_override; }
    inline void set_allow_override( bool v ) { policy_.allow_override = v; }
    inline bool allow_deletion() const { return policy_.allow_deletion; }
    inline void set_allow_deletion( bool v ) { policy_.allow_deletion = v; }

    // Extension operations
    bool add_operation( const std::string& name,
      OperationRegistry::Callback callback, bool silent = false );
    bool remove_operation( const std::string& name, bool silent = true );
    std::vector< std::string > installed_operations() const;

    // std::nullopt when nothing is installed under the name
    std::optional< ordered_node > invoke_operation( const std::string& name,
      const ordered_node& args = ordered_node() );

    static std::vector< std::string > eligible_operation_names();
    static std::vector< std::string > protected_operation_names();

    // Introspection
    std::size_t occurrence_count( const std::string& key ) const;
    std::vector< std::string > duplicate_names() const;
    std::vector< std::string > unique_names() const;
    ordered_node flatten() const;

  private:
    ordered_node own_;
    std::vector< Source* > sources_;
    Policy policy_;
    OperationRegistry operations_;

    // Counts of each enumerated name in first-appearance order, plus the
    // names in the order they reach a second occurrence
    struct NameTally {
      std::vector< std::pair< std::string, std::size_t > > counts;
      std::vector< std::string > repeated;
    };

    NameTally tally_names() const;
  };

} // namespace multidel

// Policy member function definitions

inline multidel::Policy multidel::Policy::from_node(
  const ordered_node& config )
{
  Policy policy;
  if ( config.is_null() ) return policy;
  if ( !config.is_mapping() ) {
    throw std::runtime_error( "Policy configuration must be a mapping." );
  }

  const std::vector< std::pair< std::string, bool Policy::* > > fields = {
    { internal::ALLOW_DUPLICATE, &Policy::allow_duplicate },
    { internal::ERROR_IF_MISSING, &Policy::error_if_missing },
    { internal::ALLOW_OVERRIDE, &Policy::allow_override },
    { internal::ALLOW_DELETION, &Policy::allow_deletion }
  };

  for ( const auto& [mk, mv] : config.map_items() ) {
    const std::string k = internal::to_string_any( mk );
    auto it = std::find_if( fields.begin(), fields.end(),
      [&]( const auto& f ) { return f.first == k; } );

    if ( it == fields.end() ) {
      std::ostringstream oss;
      oss << "Unknown policy key '" << k << "'; expected one of: ";
      for ( std::size_t i = 0; i < fields.size(); ++i ) {
        if ( i ) oss << ", ";
        oss << fields[ i ].first;
      }
      throw std::runtime_error( oss.str() );
    }
    if ( !mv.is_boolean() ) {
      std::ostringstream oss;
      oss << "Policy key '" << k << "' must be a boolean (got '"
        << internal::to_string_any( mv ) << "').";
      throw std::runtime_error( oss.str() );
    }
    policy.*( it->second ) = internal::to_native_checked< bool >( mv );
  }
  return policy;
}

inline multidel::Policy multidel::Policy::from_yaml( const std::string& text )
{
  return from_node( ordered_node::deserialize(text) );
}

// NodeSource member function definitions

inline multidel::NodeSource::NodeSource( ordered_node mapping )
  : mapping_( std::move(mapping) )
{
  if ( !mapping_.is_mapping() ) {
    throw std::runtime_error( "NodeSource requires a mapping node." );
  }
  for ( const auto& [mk, mv] : mapping_.map_items() ) {
    if ( !mk.is_string() ) {
      std::ostringstream oss;
      oss << "NodeSource keys must be strings (got '"
        << internal::to_string_any( mk ) << "').";
      throw std::runtime_error( oss.str() );
    }
  }
}

inline multidel::NodeSource multidel::NodeSource::from_yaml(
  const std::string& text )
{
  ordered_node doc = ordered_node::deserialize( text );
  if ( doc.is_null() ) return NodeSource();
  return NodeSource( std::move(doc) );
}

inline bool multidel::NodeSource::has( const std::string& key ) const {
  return mapping_.contains( key );
}

inline std::optional< multidel::ordered_node > multidel::NodeSource::get(
  const std::string& key ) const
{
  if ( !mapping_.contains(key) ) return std::nullopt;
  return mapping_.at( key );
}

inline std::vector< std::string > multidel::NodeSource::keys() const {
  std::vector< std::string > out;
  out.reserve( mapping_.size() );
  for ( const auto& [mk, mv] : mapping_.map_items() ) {
    out.push_back( mk.get_value< std::string >() );
  }
  return out;
}

inline bool multidel::NodeSource::erase( const std::string& key ) {
  if ( !mapping_.contains(key) ) return false;
  mapping_ = internal::mapping_without( mapping_, key );
  return true;
}

inline void multidel::NodeSource::set( const std::string& key,
  const ordered_node& value )
{
  mapping_[ key ] = value;
}

// OperationRegistry member function definitions

inline bool multidel::OperationRegistry::add( const std::string& name,
  Callback callback, bool silent )
{
  auto op = internal::lookup_operation( internal::ELIGIBLE_OPERATIONS, name );
  if ( !op ) {
    if ( silent ) return false;
    std::ostringstream oss;
    oss << "Operation '" << name
      << "' is not in the list of operations allowed to be added.";
    internal::throw_error( ErrorKind::OperationNotAllowed, oss.str() );
  }
  callbacks_[ *op ] = std::move( callback );
  return true;
}

inline bool multidel::OperationRegistry::remove( const std::string& name,
  bool silent )
{
  if ( !silent
    && internal::lookup_operation(internal::PROTECTED_OPERATIONS, name) )
  {
    std::ostringstream oss;
    oss << "Operation '" << name << "' is protected and cannot be removed.";
    internal::throw_error( ErrorKind::ProtectedOperation, oss.str() );
  }

  auto op = internal::lookup_operation( internal::ELIGIBLE_OPERATIONS, name );
  if ( !op ) return false;
  callbacks_.erase( *op );
  return true;
}

inline const multidel::OperationRegistry::Callback*
  multidel::OperationRegistry::find( const std::string& name ) const
{
  auto op = internal::lookup_operation( internal::ELIGIBLE_OPERATIONS, name );
  if ( !op ) return nullptr;
  auto it = callbacks_.find( *op );
  if ( it == callbacks_.end() ) return nullptr;
  return &it->second;
}

inline std::vector< std::string >
  multidel::OperationRegistry::installed_names() const
{
  std::vector< std::string > out;
  for ( const auto& entry : internal::ELIGIBLE_OPERATIONS ) {
    if ( callbacks_.count(entry.first) ) out.push_back( entry.second );
  }
  return out;
}

inline std::vector< std::string >
  multidel::OperationRegistry::eligible_names()
{
  return internal::operation_names( internal::ELIGIBLE_OPERATIONS );
}

inline std::vector< std::string >
  multidel::OperationRegistry::protected_names()
{
  return internal::operation_names( internal::PROTECTED_OPERATIONS );
}

// Composite member function definitions

inline multidel::Composite::Composite( std::vector< Source* > sources,
  const Policy& policy )
  : own_( ordered_node::mapping() ), sources_(), policy_( policy ),
    operations_()
{
  // Null entries are skipped and repeats collapse onto the first occurrence
  for ( Source* s : sources ) {
    if ( s ) this->add_source( *s );
  }
}

inline multidel::Composite::Composite( std::vector< Source* > sources,
  bool allow_duplicate, bool error_if_missing, bool allow_override,
  bool allow_deletion )
  : Composite( std::move(sources), Policy{ allow_duplicate, error_if_missing,
      allow_override, allow_deletion } )
{
}

inline bool multidel::Composite::has( const std::string& key ) const {
  if ( own_.contains(key) ) return true;
  for ( const Source* s : sources_ ) {
    if ( s->has(key) ) return true;
  }
  return false;
}

// Own storage wins outright. Otherwise every source is scanned and the last
// one holding the key supplies the value; the policy is checked only after
// the full scan.
inline std::optional< multidel::ordered_node > multidel::Composite::get(
  const std::string& key ) const
{
  if ( own_.contains(key) ) return own_.at( key );

  std::optional< ordered_node > found;
  std::size_t counter = 0;
  for ( const Source* s : sources_ ) {
    if ( s->has(key) ) {
      found = s->get( key );
      ++counter;
    }
  }

  if ( counter > 1 && !policy_.allow_duplicate ) {
    std::ostringstream oss;
    oss << "Property '" << key << "' exists in " << counter
      << " sources and duplication is disallowed.";
    internal::throw_error( ErrorKind::DuplicateProperty, oss.str() );
  }
  if ( counter == 0 && policy_.error_if_missing ) {
    std::ostringstream oss;
    oss << "Property '" << key << "' not found in any source.";
    internal::throw_error( ErrorKind::MissingProperty, oss.str() );
  }
  return found;
}

// A key held by a source is shadowed in own storage; the source itself is
// never written. Shadowing needs allow-override unless error-if-missing is
// set, and own storage is left untouched when the write is refused.
inline void multidel::Composite::set( const std::string& key,
  const ordered_node& value )
{
  if ( own_.contains(key) ) {
    own_[ key ] = value;
    return;
  }

  bool found = false;
  for ( const Source* s : sources_ ) {
    if ( s->has(key) ) found = true;
  }

  if ( policy_.error_if_missing ) {
    if ( !found ) {
      std::ostringstream oss;
      oss << "Property '" << key << "' not found in any source; creating a"
        << " new one is disallowed while error-if-missing is set.";
      internal::throw_error( ErrorKind::MissingProperty, oss.str() );
    }
  }
  else if ( !policy_.allow_override ) {
    std::ostringstream oss;
    if ( found ) {
      oss << "Cannot override property '" << key << "' of a source:"
        << " overriding is currently disallowed.";
    }
    else {
      oss << "Cannot add property '" << key
        << "': overriding is currently disallowed.";
    }
    internal::throw_error( ErrorKind::OverrideDisallowed, oss.str() );
  }
  own_[ key ] = value;
}

// Own keys first, then each source's keys in list order. Repeats are kept.
inline std::vector< std::string > multidel::Composite::keys() const {
  std::vector< std::string > out;
  for ( const auto& [mk, mv] : own_.map_items() ) {
    out.push_back( mk.get_value< std::string >() );
  }
  for ( const Source* s : sources_ ) {
    std::vector< std::string > names = s->keys();
    out.insert( out.end(), names.begin(), names.end() );
  }
  return out;
}

// Own entries are always deletable. Anything else is removed from every
// source holding it, and only when deletion is allowed.
inline bool multidel::Composite::erase( const std::string& key ) {
  if ( own_.contains(key) ) {
    own_ = internal::mapping_without( own_, key );
    return true;
  }

  if ( !policy_.allow_deletion ) {
    std::ostringstream oss;
    oss << "Cannot delete property '" << key << "': deletion through the"
      << " composite is disallowed. When allowed, the property is removed"
      << " from every source that has it.";
    internal::throw_error( ErrorKind::DeletionDisallowed, oss.str() );
  }

  bool deleted = false;
  for ( Source* s : sources_ ) {
    if ( s->has(key) && s->erase(key) ) deleted = true;
  }
  return deleted;
}

inline void multidel::Composite::add_own_property( const std::string& key,
  const ordered_node& value )
{
  if ( !policy_.allow_override && this->has(key) ) {
    std::ostringstream oss;
    oss << "Property '" << key << "' already exists in the hierarchy and"
      << " overriding it is currently disallowed.";
    internal::throw_error( ErrorKind::OverrideDisallowed, oss.str() );
  }
  own_[ key ] = value;
}

inline bool multidel::Composite::delete_own_property( const std::string& key,
  bool silent )
{
  if ( !own_.contains(key) ) {
    if ( !silent ) {
      std::ostringstream oss;
      oss << "Cannot delete own property '" << key << "': not present.";
      internal::throw_error( ErrorKind::UnknownOwnProperty, oss.str() );
    }
    return false;
  }
  own_ = internal::mapping_without( own_, key );
  return true;
}

inline bool multidel::Composite::has_own_property(
  const std::string& key ) const
{
  return own_.contains( key );
}

inline bool multidel::Composite::add_source( Source& source,
  bool put_upfront )
{
  if ( this->is_source_in_hierarchy(source) ) return false;
  if ( put_upfront ) {
    sources_.insert( sources_.begin(), &source );
  }
  else {
    sources_.push_back( &source );
  }
  return true;
}

inline bool multidel::Composite::remove_source( const Source& source,
  bool silent )
{
  auto it = std::find( sources_.begin(), sources_.end(), &source );
  if ( it == sources_.end() ) {
    if ( !silent ) {
      internal::throw_error( ErrorKind::UnknownSource,
        "Source is not in the hierarchy and silent is false." );
    }
    return false;
  }
  sources_.erase( it );
  return true;
}

inline bool multidel::Composite::is_source_in_hierarchy(
  const Source& source ) const
{
  return std::find( sources_.begin(), sources_.end(), &source )
    != sources_.end();
}

// Safe means none of the candidate's names is visible through this
// composite yet
inline bool multidel::Composite::can_source_be_safely_added(
  const Source& source ) const
{
  if ( this->is_source_in_hierarchy(source) ) return false;

  const std::vector< std::string > mine = this->keys();
  for ( const auto& name : source.keys() ) {
    if ( std::find(mine.begin(), mine.end(), name) != mine.end() ) {
      return false;
    }
  }
  return true;
}

inline bool multidel::Composite::add_source_if_safe( Source& source ) {
  if ( !this->can_source_be_safely_added(source) ) return false;
  return this->add_source( source );
}

inline bool multidel::Composite::add_operation( const std::string& name,
  OperationRegistry::Callback callback, bool silent )
{
  return operations_.add( name, std::move(callback), silent );
}

inline bool multidel::Composite::remove_operation( const std::string& name,
  bool silent )
{
  return operations_.remove( name, silent );
}

inline std::vector< std::string >
  multidel::Composite::installed_operations() const
{
  return operations_.installed_names();
}

inline std::optional< multidel::ordered_node >
  multidel::Composite::invoke_operation( const std::string& name,
    const ordered_node& args )
{
  const OperationRegistry::Callback* cb = operations_.find( name );
  if ( !cb || !*cb ) return std::nullopt;
  return ( *cb )( *this, args );
}

inline std::vector< std::string >
  multidel::Composite::eligible_operation_names()
{
  return OperationRegistry::eligible_names();
}

inline std::vector< std::string >
  multidel::Composite::protected_operation_names()
{
  return OperationRegistry::protected_names();
}

inline std::size_t multidel::Composite::occurrence_count(
  const std::string& key ) const
{
  std::size_t counter = 0;
  if ( own_.contains(key) ) ++counter;
  for ( const Source* s : sources_ ) {
    if ( s->has(key) ) ++counter;
  }
  return counter;
}

inline multidel::Composite::NameTally
  multidel::Composite::tally_names() const
{
  NameTally tally;
  std::unordered_map< std::string, std::size_t > index;
  for ( const auto& name : this->keys() ) {
    auto it = index.find( name );
    if ( it == index.end() ) {
      index.emplace( name, tally.counts.size() );
      tally.counts.emplace_back( name, 1 );
    }
    else if ( ++tally.counts[ it->second ].second == 2 ) {
      tally.repeated.push_back( name );
    }
  }
  return tally;
}

// Names are reported in the order they first become duplicates, i.e. by
// the position of their second occurrence
inline std::vector< std::string > multidel::Composite::duplicate_names() const
{
  return this->tally_names().repeated;
}

inline std::vector< std::string > multidel::Composite::unique_names() const {
  std::vector< std::string > out;
  for ( const auto& [name, count] : this->tally_names().counts ) {
    if ( count == 1 ) out.push_back( name );
  }
  return out;
}

// One entry per distinct visible name, valued as get() would return it
inline multidel::ordered_node multidel::Composite::flatten() const {
  ordered_node result = ordered_node::mapping();
  for ( const auto& entry : this->tally_names().counts ) {
    std::optional< ordered_node > value = this->get( entry.first );
    // A source may list a key it then fails to report through has()
    if ( !value ) continue;
    result[ entry.first ] = *value;
  }
  return result;
}
