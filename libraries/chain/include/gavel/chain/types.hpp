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

#include <gavel/protocol/types.hpp>
#include <gavel/protocol/identity.hpp>

#include <gavel/db/object.hpp>

namespace gavel { namespace chain {

   using namespace gavel::protocol;
   using gavel::db::object;
   using gavel::db::object_id_type;
   using gavel::db::abstract_object;

   enum object_space
   {
      ledger_ids = 1
   };

   enum ledger_object_type
   {
      null_object_type,
      account_object_type,
      custody_account_object_type,
      LEDGER_OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

} } // gavel::chain

FC_REFLECT_ENUM( gavel::chain::ledger_object_type,
                 (null_object_type)
                 (account_object_type)
                 (custody_account_object_type)
                 (LEDGER_OBJECT_TYPE_COUNT) )
