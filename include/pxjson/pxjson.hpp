#pragma once

// pxjson: a JSON text engine. Encoding detection, a pull parser, eager and
// streaming decoding into `pxjson::value`, typed accessors and an encoder.

#include <pxjson/error.hpp>
#include <pxjson/chars.hpp>
#include <pxjson/decimal.hpp>
#include <pxjson/value.hpp>
#include <pxjson/encoding.hpp>
#include <pxjson/parser.hpp>
#include <pxjson/handler.hpp>
#include <pxjson/decoder.hpp>
#include <pxjson/accessors.hpp>
#include <pxjson/encoder.hpp>
