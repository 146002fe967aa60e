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

#include <sentinel/sentinel.h>
#include <sentinel/log.h>

#include <getopt.h>
#include <sys/stat.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>

#if !defined( SENTINEL_VERSION )
#  define SENTINEL_VERSION "0.0.0"
#endif

static const char* g_sentinel_watch_msg[SENTINEL_CATEGORY_COUNT] =
{
	"Watching for creation.\n",
	"Watching for write.\n",
	"Watching for delete.\n",
	"Watching for rename.\n",
	"Watching for permission changes.\n"
};

static void print_usage( const char* argv0 )
{
	printf( "Usage:\n"
	        "  %s [OPTIONS] [PATH...]\n"
	        "\n"
	        "Application Options:\n"
	        "  -v, --verbose              Print more details during operation, otherwise remain quiet until an error occurs.\n"
	        "  -V, --version              Show program version and exit.\n"
	        "  -L, --loop                 Don't quit after each triggered event.\n"
	        "\n"
	        "Trigger flags:\n"
	        "  -c, --create               Watch for new files.\n"
	        "  -w, --write                Watch for changed files.\n"
	        "  -d, --delete               Watch for deletion.\n"
	        "  -r, --rename               Watch for renamed files.\n"
	        "  -m, --chmod                Watch for attribute changes (date or permissions).\n"
	        "\n"
	        "Scripts:\n"
	        "  -C, --createaction=SCRIPT  Script to run when a file is created. Implies -c.\n"
	        "  -W, --writeaction=SCRIPT   Script to run when a file is edited. Implies -w.\n"
	        "  -D, --deleteaction=SCRIPT  Script to run when a file is deleted. Implies -d.\n"
	        "  -R, --renameaction=SCRIPT  Script to run when a file is renamed. Implies -r.\n"
	        "  -M, --chmodaction=SCRIPT   Script to run when a file's date or permissions change. Implies -m.\n"
	        "  -S, --scriptaction=SCRIPT  Script to run for all events. Overrides the other scripts and implies all trigger flags.\n"
	        "\n"
	        "Help Options:\n"
	        "  -h, --help                 Show this help message.\n"
	        "\n"
	        "Scripts get the triggering event in " SENTINEL_ENV_ACTION " and the affected path in " SENTINEL_ENV_PATH ".\n",
	        argv0 );
}

static bool path_exists( const char* path )
{
	struct stat statbuf;
	return stat( path, &statbuf ) == 0;
}

int main( int argc, char** argv )
{
	static const option long_opts[] =
	{
		{ "verbose",      no_argument,       0x0, 'v' },
		{ "version",      no_argument,       0x0, 'V' },
		{ "help",         no_argument,       0x0, 'h' },
		{ "loop",         no_argument,       0x0, 'L' },
		{ "create",       no_argument,       0x0, 'c' },
		{ "write",        no_argument,       0x0, 'w' },
		{ "delete",       no_argument,       0x0, 'd' },
		{ "rename",       no_argument,       0x0, 'r' },
		{ "chmod",        no_argument,       0x0, 'm' },
		{ "createaction", required_argument, 0x0, 'C' },
		{ "writeaction",  required_argument, 0x0, 'W' },
		{ "deleteaction", required_argument, 0x0, 'D' },
		{ "renameaction", required_argument, 0x0, 'R' },
		{ "chmodaction",  required_argument, 0x0, 'M' },
		{ "scriptaction", required_argument, 0x0, 'S' },
		{ 0x0, 0, 0x0, 0 }
	};

	sentinel_options options;
	memset( &options, 0x0, sizeof( options ) );
	bool verbose = false;

	int opt;
	while( ( opt = getopt_long( argc, argv, "vVhLcwdrmC:W:D:R:M:S:", long_opts, 0x0 ) ) != -1 )
	{
		switch( opt )
		{
			case 'v': verbose = true; break;
			case 'V':
				printf( "Sentinel %s\n", SENTINEL_VERSION );
				return 0;
			case 'h':
				print_usage( argv[0] );
				return 0;
			case 'L': options.loop = true; break;
			case 'c': options.flags |= SENTINEL_CATEGORY_CREATE; break;
			case 'w': options.flags |= SENTINEL_CATEGORY_WRITE;  break;
			case 'd': options.flags |= SENTINEL_CATEGORY_DELETE; break;
			case 'r': options.flags |= SENTINEL_CATEGORY_RENAME; break;
			case 'm': options.flags |= SENTINEL_CATEGORY_CHMOD;  break;
			case 'C': options.scripts[0] = optarg; break;
			case 'W': options.scripts[1] = optarg; break;
			case 'D': options.scripts[2] = optarg; break;
			case 'R': options.scripts[3] = optarg; break;
			case 'M': options.scripts[4] = optarg; break;
			case 'S': options.script_all = optarg; break;
			default:
				// ... getopt_long already told the user what was wrong ...
				return 1;
		}
	}

	sentinel_log_set_verbose( verbose );

	options.paths     = argv + optind;
	options.paths_cnt = (size_t)( argc - optind );

	if( options.paths_cnt == 0 )
		sentinel_log_warn( "No paths specified." );
	for( size_t i = 0; i < options.paths_cnt; ++i )
		if( !path_exists( options.paths[i] ) )
			sentinel_log_warn( "Path %s does not exist.", options.paths[i] );

	sentinel_config config;
	sentinel_config_reconcile( &options, &config );

	for( size_t i = 0; i < SENTINEL_CATEGORY_COUNT; ++i )
		if( config.enabled & sentinel_category_at( i ) )
			sentinel_log_verbose( "%s", g_sentinel_watch_msg[i] );

	sentinel_watch_t watcher = sentinel_watch_create( SENTINEL_WATCH_BLOCKING, 0x0 );
	if( watcher == 0x0 )
	{
		sentinel_log_error( "Error: couldn't create watcher: %s", strerror( errno ) );
		return 1;
	}

	int status = sentinel_run( &config, sentinel_watch_source( watcher ), 0x0 );

	sentinel_watch_destroy( watcher );
	return status;
}
