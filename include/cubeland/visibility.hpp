#pragma once

// Shared library visibility macros:
//
// CUBELAND_API - public symbol (exported from shared library)
// CUBELAND_LOCAL - private symbol (not visible outside shared library)
//
// The library is built with `-fvisibility=hidden` when shared,
// so only `CUBELAND_API`-marked classes and functions are reachable
// from the tool and tests. Static builds ignore the distinction.

#if defined(CUBELAND_STATIC)
	#define CUBELAND_API
	#define CUBELAND_LOCAL
#elif !defined(_WIN32)
	#define CUBELAND_API __attribute__((visibility("default")))
	#define CUBELAND_LOCAL __attribute__((visibility("hidden")))
#else
	#ifdef CUBELAND_EXPORTS
		#define CUBELAND_API __declspec(dllexport)
	#else
		#define CUBELAND_API __declspec(dllimport)
	#endif
	#define CUBELAND_LOCAL
#endif
