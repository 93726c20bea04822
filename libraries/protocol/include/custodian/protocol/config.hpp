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

#define CUSTODIAN_MAX_SHARE_SUPPLY int64_t(1000000000000000ll)

#define CUSTODIAN_100_PERCENT 10000
#define CUSTODIAN_1_PERCENT   (CUSTODIAN_100_PERCENT/100)

/** fee rates are expressed in basis points, the upper bound is exclusive */
#define CUSTODIAN_MAX_FEE_BIPS (CUSTODIAN_100_PERCENT - 1)

#define CUSTODIAN_DEFAULT_FEE_BIPS 10

#define CUSTODIAN_MAX_ORDER_ID_LENGTH      255
#define CUSTODIAN_MAX_METADATA_LENGTH      2048
#define CUSTODIAN_MAX_DISPUTE_REASON_LENGTH 2048
#define CUSTODIAN_MAX_PRINCIPAL_LENGTH     255

/** no escrow may be locked for longer than ten years */
#define CUSTODIAN_MAX_RELEASE_DELAY (60*60*24*365*10)

#define CUSTODIAN_DEFAULT_ESCROW_TEMPLATE "custodian.escrow.v1"

#define CUSTODIAN_MAX_NESTED_OBJECTS (200)

/**
 *  The principal under which an escrow instance or the factory hold funds on the
 *  ledger is their object id, e.g. "1.2.7"; this is the factory's.
 */
#define CUSTODIAN_FACTORY_PRINCIPAL "2.0.0"
