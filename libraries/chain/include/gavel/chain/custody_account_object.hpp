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
#include <gavel/chain/types.hpp>
#include <gavel/chain/account_object.hpp>
#include <gavel/db/generic_index.hpp>

namespace gavel { namespace chain {

   /**
    *  @brief holds a quantity of one asset under the control of one authority
    *  @ingroup object
    *
    *  @ref deposit is native currency that was paid to open the account.  It is paid out to the
    *  destination named when the account is closed, which requires @ref amount to be zero.
    */
   class custody_account_object : public abstract_object<custody_account_object, ledger_ids, custody_account_object_type>
   {
      public:
         identity key;
         identity mint;
         identity authority;
         uint64_t amount  = 0;
         uint64_t deposit = 0;
   };

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      custody_account_object,
      indexed_by<
         ordered_unique< tag<by_id>,
            member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_key>,
            member< custody_account_object, identity, &custody_account_object::key > >
      >
   > custody_account_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<custody_account_object, custody_account_multi_index_type> custody_account_index;

} } // gavel::chain

FC_REFLECT_DERIVED( gavel::chain::custody_account_object, (gavel::db::object),
                    (key)(mint)(authority)(amount)(deposit) )
