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
#include <gavel/db/generic_index.hpp>

namespace gavel { namespace chain {

   /**
    *  @brief a storage account on the ledger
    *  @ingroup object
    *
    *  Holds a native balance and an opaque data area.  Only @ref owner may rewrite the data;
    *  an auction record slot is an account owned by the auction protocol whose data is the
    *  packed auction_record.
    */
   class account_object : public abstract_object<account_object, ledger_ids, account_object_type>
   {
      public:
         identity     key;
         uint64_t     balance = 0;
         /// program allowed to write data, null for the system
         identity     owner;
         vector<char> data;
   };

   using boost::multi_index::multi_index_container;
   using boost::multi_index::indexed_by;
   using boost::multi_index::ordered_unique;
   using boost::multi_index::tag;
   using boost::multi_index::member;
   using gavel::db::by_id;
   using gavel::db::generic_index;

   struct by_key;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>,
            member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_key>,
            member< account_object, identity, &account_object::key > >
      >
   > account_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_object, account_multi_index_type> account_index;

} } // gavel::chain

FC_REFLECT_DERIVED( gavel::chain::account_object, (gavel::db::object),
                    (key)(balance)(owner)(data) )
