/*
   A small tool for running scripts when watched files change.

   version 0.1, october, 2026

   Copyright (C) 2026- The sentinel authors

   This software is provided 'as-is', without any express or implied
   warranty.  In no event will the authors be held liable for any damages
   arising from the use of this software.

   Permission is granted to anyone to use this software for any purpose,
   including commercial applications, and to alter it and redistribute it
   freely, subject to the following restrictions:

   1. The origin of this software must not be misrepresented; you must not
      claim that you wrote the original software. If you use this software
      in a product, an acknowledgment in the product documentation would be
      appreciated but is not required.
   2. Altered source versions must be plainly marked as such, and must not be
      misrepresented as being the original software.
   3. This notice may not be removed or altered from any source distribution.

   The sentinel authors
*/

#ifndef SENTINEL_LOG_H_INCLUDED
#define SENTINEL_LOG_H_INCLUDED

#ifdef __cplusplus
extern "C" {
#endif  // __cplusplus

void sentinel_log_set_verbose( bool verbose );
bool sentinel_log_is_verbose();

/**
 * printf to stdout, only in verbose mode.
 */
void sentinel_log_verbose( const char* fmt, ... );

/**
 * printf to stderr with a trailing newline.
 */
void sentinel_log_warn( const char* fmt, ... );

/**
 * printf to stderr with a trailing newline.
 */
void sentinel_log_error( const char* fmt, ... );

#ifdef __cplusplus
}
#endif  // __cplusplus

#endif // SENTINEL_LOG_H_INCLUDED
