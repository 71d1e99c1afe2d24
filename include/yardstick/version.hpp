/*
 * Fallback version string. The build normally defines YARDSTICK_VERSION_STRING
 * from the project version; this default keeps standalone compiles working.
 */

#pragma once

#ifndef YARDSTICK_VERSION_STRING
#define YARDSTICK_VERSION_STRING "0.1.0+dev"
#endif
