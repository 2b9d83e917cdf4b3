#pragma once

// Generic helper macros that don't have their own headers.

// Convert to a string.
#define RM_STR(...) RM_STR_(__VA_ARGS__)
#define RM_STR_(...) #__VA_ARGS__
