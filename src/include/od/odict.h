// Public header for the odict library
#pragma once

#include <od/dictionary.h>
#include <od/error.h>
#include <od/json.h>
#include <od/key.h>
#include <od/key_value_source.h>
#include <od/merge.h>
#include <od/ordered_map.h>
#include <od/value.h>
