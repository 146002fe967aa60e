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

#include <sentinel/log.h>

#include <stdarg.h>
#include <stdio.h>

static bool g_sentinel_verbose = false;

void sentinel_log_set_verbose( bool verbose )
{
	g_sentinel_verbose = verbose;
}

bool sentinel_log_is_verbose()
{
	return g_sentinel_verbose;
}

void sentinel_log_verbose( const char* fmt, ... )
{
	if( !g_sentinel_verbose )
		return;

	va_list args;
	va_start( args, fmt );
	vfprintf( stdout, fmt, args );
	va_end( args );
	fflush( stdout );
}

static void sentinel_log_line( const char* fmt, va_list args )
{
	vfprintf( stderr, fmt, args );
	fputc( '\n', stderr );
}

void sentinel_log_warn( const char* fmt, ... )
{
	va_list args;
	va_start( args, fmt );
	sentinel_log_line( fmt, args );
	va_end( args );
}

void sentinel_log_error( const char* fmt, ... )
{
	va_list args;
	va_start( args, fmt );
	sentinel_log_line( fmt, args );
	va_end( args );
}
