#pragma once
///@file

/* Needed for the thread registration API. */
#define GC_THREADS 1
#include <gc/gc.h>
