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

#include <custodian/protocol/operations.hpp>
#include <custodian/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace custodian { namespace protocol {

FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( validation_exception,             protocol_exception, 4010000,
                                "operation validation exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( null_principal_exception,         validation_exception, 4010001,
                                "identity must not be null" )
FC_IMPLEMENT_DERIVED_EXCEPTION( empty_order_id_exception,         validation_exception, 4010002,
                                "order id must not be empty" )
FC_IMPLEMENT_DERIVED_EXCEPTION( zero_amount_exception,            validation_exception, 4010003,
                                "amount must be greater than zero" )
FC_IMPLEMENT_DERIVED_EXCEPTION( fee_bips_out_of_range_exception,  validation_exception, 4010004,
                                "fee rate out of range" )
FC_IMPLEMENT_DERIVED_EXCEPTION( empty_dispute_reason_exception,   validation_exception, 4010005,
                                "dispute reason must not be empty" )
FC_IMPLEMENT_DERIVED_EXCEPTION( empty_metadata_exception,         validation_exception, 4010006,
                                "metadata must not be empty" )
FC_IMPLEMENT_DERIVED_EXCEPTION( release_delay_out_of_range_exception, validation_exception, 4010007,
                                "release delay out of range" )
FC_IMPLEMENT_DERIVED_EXCEPTION( field_too_long_exception,         validation_exception, 4010008,
                                "field exceeds its maximum length" )
FC_IMPLEMENT_DERIVED_EXCEPTION( reserved_principal_exception,     validation_exception, 4010009,
                                "identity is reserved for custody" )

struct operation_validator
{
   typedef void result_type;
   template<typename T>
   void operator()( const T& v )const { v.validate(); }
};

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

} } // namespace custodian::protocol

CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::operation )
