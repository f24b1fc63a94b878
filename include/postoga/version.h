#pragma once

#define POSTOGA_VERSION_MAJOR 0
#define POSTOGA_VERSION_MINOR 13
#define POSTOGA_VERSION_PATCH 0
#define POSTOGA_VERSION "0.13.0"
