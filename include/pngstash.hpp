#pragma once

/*
===============================================================================
pngstash: Public API Entry Point
===============================================================================

pngstash reads, edits and writes PNG-style chunk containers:

  Container  signature + ordered records (parse / serialize / append /
             find_by_type / remove_by_type)
  Record     one framed chunk, CRC-32 checked
  TypeCode   4-byte chunk tag with its property bits

The command layer (pngstash::command) wraps these with whole-file I/O for the
pngstash executable.

All decoding is done on complete in-memory buffers. Malformed input is
reported through typed error values, never by throwing.
===============================================================================
*/

#include <pngstash/version.hpp>
#include <pngstash/codec/constants.hpp>
#include <pngstash/codec/type_code.hpp>
#include <pngstash/codec/record.hpp>
#include <pngstash/codec/container.hpp>
