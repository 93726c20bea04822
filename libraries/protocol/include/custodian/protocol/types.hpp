/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#pragma once
#include <custodian/db/object_id.hpp>
#include <custodian/protocol/config.hpp>

#include <fc/container/flat_fwd.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/uint128.hpp>
#include <fc/io/datastream.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/tuple/elem.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#define CUSTODIAN_EXTERNAL_SERIALIZATION(ext, type) \
namespace fc { \
   ext template void from_variant( const variant& v, type& vo, uint32_t max_depth ); \
   ext template void to_variant( const type& v, variant& vo, uint32_t max_depth ); \
namespace raw { \
   ext template void pack< datastream<size_t>, type >( datastream<size_t>& s, const type& tx, uint32_t _max_depth ); \
   ext template void pack< datastream<char*>, type >( datastream<char*>& s, const type& tx, uint32_t _max_depth ); \
   ext template void unpack< datastream<const char*>, type >( datastream<const char*>& s, type& tx, uint32_t _max_depth ); \
} } // fc::raw
#define CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION(type) CUSTODIAN_EXTERNAL_SERIALIZATION(extern, type)
#define CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION(type) CUSTODIAN_EXTERNAL_SERIALIZATION(/*not extern*/, type)

#define CUSTODIAN_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define CUSTODIAN_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define CUSTODIAN_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            CUSTODIAN_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define CUSTODIAN_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(custodian::id_namespace::name)

#define CUSTODIAN_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace custodian { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(CUSTODIAN_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(CUSTODIAN_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(custodian::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(CUSTODIAN_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(CUSTODIAN_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(CUSTODIAN_NAME_TO_ID_TYPE, , names_seq))

namespace custodian { namespace protocol {
using namespace custodian::db;

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;
using std::make_pair;

using fc::variant;
using fc::variant_object;
using fc::mutable_variant_object;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;
using fc::optional;
using fc::time_point;
using fc::time_point_sec;

typedef fc::safe<int64_t> share_type;

/**
 *  An opaque, comparable identity of a party taking part in custody: payer,
 *  payee, arbitrator, fee collector, factory owner. The engine never interprets
 *  the name; an empty name is the null principal.
 */
struct principal_type
{
   principal_type() = default;
   principal_type( const string& n ) : name( n ) {}
   principal_type( const char* n ) : name( n ) {}

   bool is_null()const { return name.empty(); }
   /// true if the name has the "space.type.instance" shape the engine uses for its own custody accounts
   bool is_custody_name()const;
   explicit operator string()const { return name; }

   friend bool operator == ( const principal_type& a, const principal_type& b ) { return a.name == b.name; }
   friend bool operator != ( const principal_type& a, const principal_type& b ) { return a.name != b.name; }
   friend bool operator <  ( const principal_type& a, const principal_type& b ) { return a.name <  b.name; }

   string name;
};

/** assets are identified by the principal of the ledger entity that issues them */
typedef principal_type asset_id_type;

struct void_t{};

enum reserved_spaces
{
   relative_protocol_ids = 0,
   protocol_ids          = 1,
   implementation_ids    = 2
};

} }  // custodian::protocol

namespace fc
{
   void to_variant( const custodian::protocol::principal_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, custodian::protocol::principal_type& vo, uint32_t max_depth = 1 );
}

/// Object types in the Protocol Space (enum object_type (1.x.x))
CUSTODIAN_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                     /* 1.0.x  */ (null) // no data
                     /* 1.1.x  */ (base) // no data
                     /* 1.2.x  */ (escrow)
                     /* 1.3.x  */ (order_intent)
                    )

FC_REFLECT( custodian::protocol::principal_type, (name) )
FC_REFLECT_TYPENAME( custodian::protocol::share_type )
FC_REFLECT( custodian::protocol::void_t, )
