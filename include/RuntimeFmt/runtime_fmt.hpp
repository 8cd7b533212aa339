#pragma once

#include "struct_introspection.hpp"
#include "errors.hpp"
#include "formatter.hpp"
#include "capabilities.hpp"
#include "accessor.hpp"
#include "codegen.hpp"
#include "format_args.hpp"
#include "resolve.hpp"
