// treecoder/treecoder.hpp - Umbrella header for the decoder
//
// Include this header to decode a Value tree into typed structures:
//   auto result = treecoder::decode<std::vector<Item>>(root);
//
#pragma once

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/decode_error.hpp"
#include "treecoder/basic/decode_result.hpp"
#include "treecoder/basic/value.hpp"
#include "treecoder/decoder/decoder.hpp"
#include "treecoder/decoder/decoding.hpp"
#include "treecoder/decoder/path_lookup.hpp"
#include "treecoder/schema/fields.hpp"
