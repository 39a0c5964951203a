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

#include <fc/exception/exception.hpp>

#define GAVEL_ASSERT( expr, exc_type, FORMAT, ... )                   \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace gavel { namespace protocol {

   FC_DECLARE_EXCEPTION( gavel_exception, 4000000 )

   FC_DECLARE_DERIVED_EXCEPTION( authorization_failure,        gavel_exception, 4010000 )
   FC_DECLARE_DERIVED_EXCEPTION( state_failure,                gavel_exception, 4020000 )
   FC_DECLARE_DERIVED_EXCEPTION( temporal_failure,             gavel_exception, 4030000 )
   FC_DECLARE_DERIVED_EXCEPTION( economic_failure,             gavel_exception, 4040000 )
   FC_DECLARE_DERIVED_EXCEPTION( resource_failure,             gavel_exception, 4050000 )
   FC_DECLARE_DERIVED_EXCEPTION( custody_failure,              gavel_exception, 4060000 )
   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_failure,           gavel_exception, 4070000 )

   FC_DECLARE_DERIVED_EXCEPTION( missing_signature,            authorization_failure, 4010001 )
   FC_DECLARE_DERIVED_EXCEPTION( identity_mismatch,            authorization_failure, 4010002 )
   FC_DECLARE_DERIVED_EXCEPTION( record_owner_mismatch,        authorization_failure, 4010003 )

   FC_DECLARE_DERIVED_EXCEPTION( auction_already_initialized,  state_failure, 4020001 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_not_initialized,      state_failure, 4020002 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_no_winner,            state_failure, 4020003 )
   FC_DECLARE_DERIVED_EXCEPTION( record_size_mismatch,         state_failure, 4020004 )

   FC_DECLARE_DERIVED_EXCEPTION( auction_expired,              temporal_failure, 4030001 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_still_open,           temporal_failure, 4030002 )

   FC_DECLARE_DERIVED_EXCEPTION( auction_bid_too_low,          economic_failure, 4040001 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_already_leader,       economic_failure, 4040002 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_has_bids,             economic_failure, 4040003 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_currency_mismatch,    economic_failure, 4040004 )

   FC_DECLARE_DERIVED_EXCEPTION( record_not_rent_exempt,       resource_failure, 4050001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,         resource_failure, 4050002 )

   FC_DECLARE_DERIVED_EXCEPTION( custody_account_not_found,    custody_failure, 4060001 )
   FC_DECLARE_DERIVED_EXCEPTION( custody_mint_mismatch,        custody_failure, 4060002 )
   FC_DECLARE_DERIVED_EXCEPTION( custody_insufficient_amount,  custody_failure, 4060003 )
   FC_DECLARE_DERIVED_EXCEPTION( custody_wrong_authority,      custody_failure, 4060004 )
   FC_DECLARE_DERIVED_EXCEPTION( custody_unproven_authority,   custody_failure, 4060005 )
   FC_DECLARE_DERIVED_EXCEPTION( custody_account_not_empty,    custody_failure, 4060006 )
   FC_DECLARE_DERIVED_EXCEPTION( custody_account_exists,       custody_failure, 4060007 )

   FC_DECLARE_DERIVED_EXCEPTION( amount_overflow,              arithmetic_failure, 4070001 )
   FC_DECLARE_DERIVED_EXCEPTION( timestamp_overflow,           arithmetic_failure, 4070002 )

} } // gavel::protocol
