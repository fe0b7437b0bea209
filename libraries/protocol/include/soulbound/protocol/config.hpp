/*
 * Copyright (c) 2023 Michel Santos and contributors.
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

#define SOULBOUND_MAX_NESTED_OBJECTS (200)

/// Interface identifiers reported by supports_interface()
/// @{
#define SOULBOUND_ERC165_INTERFACE_ID          (0x01ffc9a7u)
#define SOULBOUND_ERC721_INTERFACE_ID          (0x80ac58cdu)
#define SOULBOUND_ERC721_METADATA_INTERFACE_ID (0x5b5e139fu)
#define SOULBOUND_ERC4906_INTERFACE_ID         (0x49064906u)
#define SOULBOUND_ERC5192_INTERFACE_ID         (0xb45a3c0eu)
/// @}

/// Upper bound on the number of records returned by a single history query
#define SOULBOUND_MAX_HISTORY_QUERY_LIMIT (100)
