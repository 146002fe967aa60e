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

#include <sentinel/watch.h>

#include <sys/inotify.h>
#include <stdint.h>
#include <stdlib.h> // malloc
#include <unistd.h> // read
#include <string.h>
#include <errno.h>

#define SENTINEL_INOTIFY_MASK ( IN_CREATE | IN_MOVED_TO | IN_MODIFY | IN_DELETE | IN_DELETE_SELF | IN_MOVED_FROM | IN_MOVE_SELF | IN_ATTRIB )

struct sentinel_watch_item
{
	int wd;
	const char* path;
};

struct sentinel_watch
{
	sentinel_source source; // needs to be first, sentinel_watch_source() hands out a pointer to it.

	sentinel_allocator* allocator;
	int notifierfd;

	size_t watches_cnt;
	size_t watches_cap;
	sentinel_watch_item* watches;

	// events read from notifierfd but not yet handed to a handler, a stopped poll resumes from read_pos.
	alignas( inotify_event ) char read_buffer[4096];
	size_t read_pos;
	size_t read_len;
};

static void* sentinel_default_realloc( sentinel_allocator*, void* ptr, size_t, size_t new_size )
{
	return realloc( ptr, new_size );
}

static void sentinel_default_free( sentinel_allocator*, void* ptr )
{
	free( ptr );
}

static sentinel_allocator g_sentinel_default_alloc = { sentinel_default_realloc, sentinel_default_free };

static void* sentinel_realloc( sentinel_allocator* allocator, void* ptr, size_t old_size, size_t new_size )
{
	return allocator->realloc( allocator, ptr, old_size, new_size );
}

static void sentinel_free( sentinel_allocator* allocator, void* ptr )
{
	if( allocator->free )
		allocator->free( allocator, ptr );
}

static char* sentinel_strdup( sentinel_allocator* allocator, const char* str )
{
	size_t len = strlen( str ) + 1;
	char* res = (char*)sentinel_realloc( allocator, 0x0, 0, len );
	if( res )
		memcpy( res, str, len );
	return res;
}

static const char* sentinel_watch_find_wd_path( sentinel_watch_t w, int wd )
{
	for( size_t i = 0; i < w->watches_cnt; ++ i )
		if( wd == w->watches[i].wd )
			return w->watches[i].path;
	return 0x0;
}

static void sentinel_watch_remove( sentinel_watch_t w, int wd )
{
	for( size_t i = 0; i < w->watches_cnt; ++ i )
	{
		if( wd != w->watches[i].wd )
			continue;

		sentinel_free( w->allocator, (void*)w->watches[i].path );
		w->watches[i].wd = 0;
		w->watches[i].path = 0x0;

		size_t swap_index = w->watches_cnt - 1;
		if( i != swap_index )
			memcpy( w->watches + i, w->watches + swap_index, sizeof( sentinel_watch_item ) );
		--w->watches_cnt;
		return;
	}
}

static int sentinel_watch_source_add( sentinel_source* source, const char* path )
{
	return sentinel_watch_add( (sentinel_watch*)source, path );
}

static void sentinel_watch_source_poll( sentinel_source* source, sentinel_watch_handler* handler )
{
	sentinel_watch_poll( (sentinel_watch*)source, handler );
}

sentinel_watch_t sentinel_watch_create( sentinel_watch_create_flags flags, sentinel_allocator* allocator )
{
	if( allocator == 0x0 )
		allocator = &g_sentinel_default_alloc;

	sentinel_watch* w = (sentinel_watch*)sentinel_realloc( allocator, 0x0, 0, sizeof( sentinel_watch ) );
	if( w == 0x0 )
	{
		errno = ENOMEM;
		return 0x0;
	}
	memset( w, 0x0, sizeof( sentinel_watch ) );
	w->source.add  = sentinel_watch_source_add;
	w->source.poll = sentinel_watch_source_poll;
	w->allocator = allocator;

	int inotify_flags = IN_CLOEXEC;
	if( ( flags & SENTINEL_WATCH_BLOCKING ) == 0 )
		inotify_flags |= IN_NONBLOCK;

	w->notifierfd = inotify_init1( inotify_flags );
	if( w->notifierfd < 0 )
	{
		int err = errno;
		sentinel_free( allocator, w );
		errno = err;
		return 0x0;
	}

	w->watches_cap = 16;
	w->watches = (sentinel_watch_item*)sentinel_realloc( w->allocator, 0x0, 0, sizeof(sentinel_watch_item) * w->watches_cap );
	if( w->watches == 0x0 )
	{
		close( w->notifierfd );
		sentinel_free( allocator, w );
		errno = ENOMEM;
		return 0x0;
	}
	return w;
}

void sentinel_watch_destroy( sentinel_watch_t watcher )
{
	close( watcher->notifierfd );
	for( size_t i = 0; i < watcher->watches_cnt; ++i )
		sentinel_free( watcher->allocator, (void*)watcher->watches[i].path );
	sentinel_free( watcher->allocator, watcher->watches );
	sentinel_free( watcher->allocator, watcher );
}

int sentinel_watch_add( sentinel_watch_t w, const char* path )
{
	int wd = inotify_add_watch( w->notifierfd, path, SENTINEL_INOTIFY_MASK );
	if( wd < 0 )
		return errno;

	// ... the same inode was already added under some path, events keep that name ...
	if( sentinel_watch_find_wd_path( w, wd ) != 0x0 )
		return 0;

	if( w->watches_cnt >= w->watches_cap )
	{
		sentinel_watch_item* watches = (sentinel_watch_item*)sentinel_realloc( w->allocator, w->watches, sizeof(sentinel_watch_item) * w->watches_cap, sizeof(sentinel_watch_item) * w->watches_cap * 2 );
		if( watches == 0x0 )
		{
			inotify_rm_watch( w->notifierfd, wd );
			return ENOMEM;
		}
		w->watches = watches;
		w->watches_cap *= 2;
	}

	char* item_path = sentinel_strdup( w->allocator, path );
	if( item_path == 0x0 )
	{
		inotify_rm_watch( w->notifierfd, wd );
		return ENOMEM;
	}

	w->watches[ w->watches_cnt ].wd = wd;
	w->watches[ w->watches_cnt ].path = item_path;
	++w->watches_cnt;
	return 0;
}

sentinel_source* sentinel_watch_source( sentinel_watch_t watcher )
{
	return &watcher->source;
}

static unsigned int sentinel_watch_ops_from_mask( uint32_t mask )
{
	unsigned int ops = 0;
	if( mask & ( IN_CREATE | IN_MOVED_TO ) )     ops |= SENTINEL_OP_CREATE;
	if( mask & IN_MODIFY )                       ops |= SENTINEL_OP_WRITE;
	if( mask & ( IN_DELETE | IN_DELETE_SELF ) )  ops |= SENTINEL_OP_REMOVE;
	if( mask & ( IN_MOVED_FROM | IN_MOVE_SELF ) ) ops |= SENTINEL_OP_RENAME;
	if( mask & IN_ATTRIB )                       ops |= SENTINEL_OP_CHMOD;
	return ops;
}

// "dir" + "/" + "name", or just the watched path for events on the watched file or dir itself.
static char* sentinel_watch_build_full_path( sentinel_allocator* allocator, const char* dirpath, const inotify_event* ev )
{
	if( ev->len == 0 )
		return sentinel_strdup( allocator, dirpath );

	size_t dirlen  = strlen( dirpath );
	size_t namelen = strlen( ev->name );
	bool   add_sep = dirlen == 0 || dirpath[dirlen - 1] != '/';
	size_t length  = dirlen + ( add_sep ? 1 : 0 ) + namelen + 1;

	char* res = (char*)sentinel_realloc( allocator, 0x0, 0, length );
	if( res )
	{
		memcpy( res, dirpath, dirlen );
		if( add_sep )
			res[dirlen++] = '/';
		memcpy( res + dirlen, ev->name, namelen );
		res[length-1] = 0;
	}
	return res;
}

void sentinel_watch_poll( sentinel_watch_t watcher, sentinel_watch_handler* handler )
{
	while( true )
	{
		if( watcher->read_pos >= watcher->read_len )
		{
			watcher->read_pos = 0;
			watcher->read_len = 0;

			ssize_t read_bytes = read( watcher->notifierfd, watcher->read_buffer, sizeof( watcher->read_buffer ) );
			if( read_bytes < 0 )
			{
				if( errno == EINTR )
					continue;
				if( errno == EAGAIN || errno == EWOULDBLOCK )
					return; // ... non-blocking and nothing more to read ...

				handler->error( handler, strerror( errno ) );
				return;
			}
			if( read_bytes == 0 )
				return;

			watcher->read_len = (size_t)read_bytes;
		}

		while( watcher->read_pos < watcher->read_len )
		{
			inotify_event* ev = (inotify_event*)( watcher->read_buffer + watcher->read_pos );
			watcher->read_pos += sizeof(inotify_event) + ev->len;

			if( ev->mask & IN_Q_OVERFLOW )
			{
				if( !handler->error( handler, "queue overflow" ) )
					return;
				continue;
			}

			const char* dirpath = sentinel_watch_find_wd_path( watcher, ev->wd );
			if( dirpath == 0x0 )
				continue;

			bool keep_going = true;
			unsigned int ops = sentinel_watch_ops_from_mask( ev->mask );
			if( ops != 0 )
			{
				char* path = sentinel_watch_build_full_path( watcher->allocator, dirpath, ev );
				if( path == 0x0 )
				{
					handler->error( handler, strerror( ENOMEM ) );
					return;
				}

				keep_going = handler->event( handler, path, ops );
				sentinel_free( watcher->allocator, path );
			}

			// ... the kernel dropped the watch, the watched path was removed or unmounted ...
			if( ev->mask & IN_IGNORED )
				sentinel_watch_remove( watcher, ev->wd );

			if( !keep_going )
				return;
		}
	}
}
