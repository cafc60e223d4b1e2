#pragma once

#define PULLJSON_VERSION_MAJOR 0
#define PULLJSON_VERSION_MINOR 3
#define PULLJSON_VERSION_PATCH 0

#include "error.hpp"
#include "log.hpp"
#include "number.hpp"
#include "event.hpp"
#include "convert.hpp"
#include "recognizer.hpp"
#include "source.hpp"
#include "basic_parse.hpp"
#include "parse.hpp"
#include "value.hpp"
#include "items.hpp"
#include "writer.hpp"
