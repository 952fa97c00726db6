/*
 * Copyright (c) 2026 Jonas 'Sortie' Termansen.
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 *
 * stat.cpp
 * Unified file metadata.
 */

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <pathlab/stat.h>

namespace Pathlab {

StatRecord::StatRecord()
{
	this->target = NULL;
	Reset();
}

StatRecord::~StatRecord()
{
	free(target);
}

void StatRecord::Reset()
{
	free(target);
	target = NULL;
	type = FILE_TYPE_FILE;
	size = 0;
	permissions = 0;
	memset(user, 0, sizeof(user));
	memset(group, 0, sizeof(group));
	user_id = 0;
	group_id = 0;
	device_id = 0;
	file_id = 0;
	hard_link_count = 0;
	memset(&create_time, 0, sizeof(create_time));
	memset(&access_time, 0, sizeof(access_time));
	memset(&modify_time, 0, sizeof(modify_time));
	memset(&status_time, 0, sizeof(status_time));
}

bool StatRecord::CopyFrom(const StatRecord* other)
{
	if ( other == this )
		return true;
	if ( !SetTarget(other->target) )
		return false;
	type = other->type;
	size = other->size;
	permissions = other->permissions;
	memcpy(user, other->user, sizeof(user));
	memcpy(group, other->group, sizeof(group));
	user_id = other->user_id;
	group_id = other->group_id;
	device_id = other->device_id;
	file_id = other->file_id;
	hard_link_count = other->hard_link_count;
	create_time = other->create_time;
	access_time = other->access_time;
	modify_time = other->modify_time;
	status_time = other->status_time;
	return true;
}

bool StatRecord::SetTarget(const char* new_target)
{
	char* copy = NULL;
	if ( new_target && !(copy = strdup(new_target)) )
		return false;
	free(target);
	target = copy;
	return true;
}

void StatRecord::SetUser(const char* name)
{
	strncpy(user, name ? name : "", STAT_NAME_MAX);
	user[STAT_NAME_MAX] = '\0';
}

void StatRecord::SetGroup(const char* name)
{
	strncpy(group, name ? name : "", STAT_NAME_MAX);
	group[STAT_NAME_MAX] = '\0';
}

uint32_t StatRecord::Mode() const
{
	return PackMode(type, permissions);
}

template <class T>
static int CompareValue(T a, T b)
{
	return a < b ? -1 : b < a ? 1 : 0;
}

static int CompareTime(const struct timespec* a, const struct timespec* b)
{
	if ( int cmp = CompareValue(a->tv_sec, b->tv_sec) )
		return cmp;
	return CompareValue(a->tv_nsec, b->tv_nsec);
}

// Orders by (mode, file_id, device_id, hard_link_count, user_id, group_id,
// size, access_time, modify_time, status_time) like a stat tuple.
int StatRecord::Compare(const StatRecord* other) const
{
	int cmp;
	if ( (cmp = CompareValue(Mode(), other->Mode())) )
		return cmp;
	if ( (cmp = CompareValue(file_id, other->file_id)) )
		return cmp;
	if ( (cmp = CompareValue(device_id, other->device_id)) )
		return cmp;
	if ( (cmp = CompareValue(hard_link_count, other->hard_link_count)) )
		return cmp;
	if ( (cmp = CompareValue(user_id, other->user_id)) )
		return cmp;
	if ( (cmp = CompareValue(group_id, other->group_id)) )
		return cmp;
	if ( (cmp = CompareValue(size, other->size)) )
		return cmp;
	if ( (cmp = CompareTime(&access_time, &other->access_time)) )
		return cmp;
	if ( (cmp = CompareTime(&modify_time, &other->modify_time)) )
		return cmp;
	return CompareTime(&status_time, &other->status_time);
}

uint32_t PackMode(int type, uint32_t permissions)
{
	uint32_t mode = permissions & PATHLAB_S_IPERM;
	switch ( type )
	{
	case FILE_TYPE_DIR: return mode | PATHLAB_S_IFDIR;
	case FILE_TYPE_SYMLINK: return mode | PATHLAB_S_IFLNK;
	case FILE_TYPE_SOCKET: return mode | PATHLAB_S_IFSOCK;
	case FILE_TYPE_FIFO: return mode | PATHLAB_S_IFIFO;
	case FILE_TYPE_CHAR_DEVICE: return mode | PATHLAB_S_IFCHR;
	case FILE_TYPE_BLOCK_DEVICE: return mode | PATHLAB_S_IFBLK;
	}
	return mode | PATHLAB_S_IFREG;
}

void UnpackMode(uint32_t mode, int* type_out, uint32_t* permissions_out)
{
	int type;
	switch ( mode & PATHLAB_S_IFMT )
	{
	case PATHLAB_S_IFDIR: type = FILE_TYPE_DIR; break;
	case PATHLAB_S_IFLNK: type = FILE_TYPE_SYMLINK; break;
	case PATHLAB_S_IFSOCK: type = FILE_TYPE_SOCKET; break;
	case PATHLAB_S_IFIFO: type = FILE_TYPE_FIFO; break;
	case PATHLAB_S_IFCHR: type = FILE_TYPE_CHAR_DEVICE; break;
	case PATHLAB_S_IFBLK: type = FILE_TYPE_BLOCK_DEVICE; break;
	default: type = FILE_TYPE_FILE; break;
	}
	if ( type_out )
		*type_out = type;
	if ( permissions_out )
		*permissions_out = mode & PATHLAB_S_IPERM;
}

const char* FileTypeName(int type)
{
	switch ( type )
	{
	case FILE_TYPE_FILE: return "file";
	case FILE_TYPE_DIR: return "dir";
	case FILE_TYPE_SYMLINK: return "symlink";
	case FILE_TYPE_SOCKET: return "socket";
	case FILE_TYPE_FIFO: return "fifo";
	case FILE_TYPE_CHAR_DEVICE: return "char_device";
	case FILE_TYPE_BLOCK_DEVICE: return "block_device";
	case FILE_TYPE_LINK: return "link";
	}
	return "unknown";
}

} // namespace Pathlab
