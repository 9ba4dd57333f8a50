#pragma once
#include "column_filter.hpp"
#include "common.hpp"
#include "exception.hpp"
#include "extract.hpp"
#include "field_reader.hpp"
#include "header.hpp"
#include "parser.hpp"
#include "readers/population.hpp"
#include "readers/property.hpp"
#include "readers/service_request.hpp"
#include "readers/zip_code.hpp"
#include "restrictions.hpp"
#include "setup.hpp"
#include "source.hpp"
#include "tokenizer.hpp"
