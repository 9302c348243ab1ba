#pragma once

#include <nibble/source/sequence.hpp>
#include <nibble/source/text.hpp>
#include <nibble/elements.hpp>
#include <nibble/take.hpp>
#include <nibble/tuple.hpp>
#include <nibble/repeat.hpp>
#include <nibble/parse.hpp>
