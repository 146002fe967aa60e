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

#ifndef SENTINEL_WATCH_H_INCLUDED
#define SENTINEL_WATCH_H_INCLUDED

#include <stddef.h> // for size_t

#ifdef __cplusplus
extern "C" {
#endif  // __cplusplus

/**
 * Flags for sentinel_watch_create(), or-ed together.
 */
enum sentinel_watch_create_flags
{
	SENTINEL_WATCH_BLOCKING = (1 << 1), ///< calls to sentinel_watch_poll should block until the handler stops the poll or an error occurs.
	SENTINEL_WATCH_DEFAULT  = 0
};

/**
 * Operations reported by a watch source, an event can carry more than one of these.
 */
enum sentinel_watch_op
{
	SENTINEL_OP_CREATE = (1 << 0), ///< file was created or moved into a watched directory.
	SENTINEL_OP_WRITE  = (1 << 1), ///< file content was modified.
	SENTINEL_OP_REMOVE = (1 << 2), ///< file was removed, or the watched path itself was.
	SENTINEL_OP_RENAME = (1 << 3), ///< file was moved away from its path, or the watched path itself was.
	SENTINEL_OP_CHMOD  = (1 << 4), ///< attributes (permissions, timestamps, link count) changed.

	SENTINEL_OP_ALL = SENTINEL_OP_CREATE |
	                  SENTINEL_OP_WRITE  |
	                  SENTINEL_OP_REMOVE |
	                  SENTINEL_OP_RENAME |
	                  SENTINEL_OP_CHMOD
};

/**
 * Handle to a platform watcher, created with sentinel_watch_create() and freed with sentinel_watch_destroy().
 */
typedef struct sentinel_watch* sentinel_watch_t;

/**
 * Allocator interface used by sentinel_watch, works the same way as realloc()/free().
 *
 * @example:
 *
 * struct my_counting_allocator
 * {
 *     sentinel_allocator alloc;
 *     size_t allocated;
 * };
 *
 * void* my_counting_realloc( sentinel_allocator* allocator, void* ptr, size_t old_size, size_t new_size )
 * {
 *     my_counting_allocator* counting = (my_counting_allocator*)allocator;
 *     counting->allocated += new_size - old_size;
 *     return realloc( ptr, new_size );
 * }
 */
struct sentinel_allocator
{
	/**
	 * realloc function, should work in the same way as realloc().
	 *
	 * @param allocator struct holding the function pointer.
	 * @param ptr to memory to realloc or 0x0 if not allocated.
	 * @param old_size size of allocation if ptr != 0x0.
	 * @param new_size requested allocation size.
	 *
	 * @return pointer to newly allocated memory or 0x0 on failure.
	 */
	void* ( *realloc )( sentinel_allocator* allocator, void* ptr, size_t old_size, size_t new_size );

	/**
	 * free function, should be used to free memory allocated with realloc().
	 * This function can be set to 0x0 if no free call is needed.
	 */
	void  ( *free )( sentinel_allocator* allocator, void* ptr );
};

/**
 * Struct used together with sentinel_watch_poll() to fetch events from a watch source.
 *
 * @example
 *
 * struct my_handler
 * {
 *     sentinel_watch_handler wh;
 *     int events;
 * };
 *
 * static bool my_event( sentinel_watch_handler* handler, const char* path, unsigned int ops )
 * {
 *     my_handler* h = (my_handler*)handler;
 *     ++h->events;
 *     return true;
 * }
 */
struct sentinel_watch_handler
{
	/**
	 * Called per event read from the source.
	 *
	 * @param path path of the affected file, the watched path joined with the entry name.
	 * @param ops bitmask of sentinel_watch_op.
	 *
	 * @return false if poll should end.
	 */
	bool ( *event )( sentinel_watch_handler* handler, const char* path, unsigned int ops );

	/**
	 * Called when the source fails. The message can be empty.
	 *
	 * @return false if poll should end.
	 */
	bool ( *error )( sentinel_watch_handler* handler, const char* message );
};

/**
 * Abstract watch source, sentinel_run() only talks to a source through this.
 * sentinel_watch_source() returns one backed by the platform watcher.
 */
struct sentinel_source
{
	/**
	 * Register a path.
	 *
	 * @return 0 on success, otherwise an errno value.
	 */
	int  ( *add  )( sentinel_source* source, const char* path );

	/**
	 * Deliver events and errors to handler, see sentinel_watch_poll().
	 */
	void ( *poll )( sentinel_source* source, sentinel_watch_handler* handler );
};

/**
 * Create a new watcher without any paths.
 *
 * @note The allocator passed to this function need to persist during the life-time of the watcher.
 *
 * @param flags sentinel_watch_create_flags.
 * @param allocator to use for this watcher or 0x0 to use malloc/free.
 *
 * @return the watcher or 0x0 on failure, errno is set in that case.
 */
sentinel_watch_t sentinel_watch_create( sentinel_watch_create_flags flags, sentinel_allocator* allocator );

/**
 * Destroy sentinel_watch_t and free all its used resources.
 */
void sentinel_watch_destroy( sentinel_watch_t watcher );

/**
 * Start watching a file or directory, directories are not watched recursively.
 *
 * @return 0 on success, otherwise an errno value.
 */
int sentinel_watch_add( sentinel_watch_t watcher, const char* path );

/**
 * Poll for events. Runs until the handler returns false, or, if the watcher was not created with
 * SENTINEL_WATCH_BLOCKING, until there are no more pending events.
 * Events already read but not delivered when the handler stopped the poll are delivered by the next poll.
 * A read failure is reported through handler->error and ends the poll.
 */
void sentinel_watch_poll( sentinel_watch_t watcher, sentinel_watch_handler* handler );

/**
 * Source interface for watcher, valid for as long as watcher is.
 */
sentinel_source* sentinel_watch_source( sentinel_watch_t watcher );

#ifdef __cplusplus
}
#endif  // __cplusplus

#endif // SENTINEL_WATCH_H_INCLUDED
