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

#include <custodian/protocol/types.hpp>

namespace custodian { namespace protocol {

bool principal_type::is_custody_name()const
{
   uint32_t groups = 0;
   size_t group_size = 0;
   for( const char c : name )
   {
      if( c == '.' )
      {
         if( group_size == 0 )
            return false;
         ++groups;
         group_size = 0;
      }
      else if( c >= '0' && c <= '9' )
         ++group_size;
      else
         return false;
   }
   return group_size > 0 && groups == 2;
}

} } // custodian::protocol

namespace fc
{
   void to_variant( const custodian::protocol::principal_type& var, fc::variant& vo, uint32_t max_depth )
   {
      vo = var.name;
   }

   void from_variant( const fc::variant& var, custodian::protocol::principal_type& vo, uint32_t max_depth )
   {
      vo = custodian::protocol::principal_type( var.as_string() );
   }
} // fc
