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
 * record.cpp
 * Decoded ISO 9660 directory records.
 */

#include <assert.h>
#include <endian.h>
#include <errno.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <pathlab/iso9660.h>
#include <pathlab/stat.h>
#include <pathlab/window.h>

#include "record.h"

namespace Pathlab {

DirectoryRecord::DirectoryRecord()
{
	this->prev_cached = NULL;
	this->next_cached = NULL;
	this->prev_hashed = NULL;
	this->next_hashed = NULL;
	this->cache_key = NULL;
	this->cache_hash = 0;
	this->reference_count = 1;
	this->name = NULL;
	this->record_offset = 0;
	this->sector = 0;
	this->size = 0;
	this->relocated_sector = 0;
	this->relocated = false;
	this->hidden = false;
	this->children = false;
	this->is_dot = false;
	this->is_dotdot = false;
	this->has_signature = false;
	this->susp_skip = 0;
}

DirectoryRecord::~DirectoryRecord()
{
	free(name);
	free(cache_key);
}

void DirectoryRecord::Refer()
{
	reference_count++;
}

void DirectoryRecord::Unref()
{
	assert(0 < reference_count);
	if ( !--reference_count )
		delete this;
}

bool ReadDualEndian32(const uint8_t* field, uint32_t* value_out)
{
	uint32_t le;
	uint32_t be;
	memcpy(&le, field, sizeof(le));
	memcpy(&be, field + 4, sizeof(be));
	le = le32toh(le);
	be = be32toh(be);
	if ( le != be )
		return errno = EBADMSG, false;
	*value_out = le;
	return true;
}

static unsigned char digit(char c)
{
	return '0' <= c && c <= '9' ? c - '0' : 0;
}

static struct timespec DecodeTimestamp(const uint8_t* time_bytes, uint8_t flags)
{
	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	struct timespec ts;
	int8_t offset;
	if ( flags & ISO9660_TF_LONG_FORM )
	{
		tm.tm_year = digit(time_bytes[0]) * 1000 +
		             digit(time_bytes[1]) * 100 +
		             digit(time_bytes[2]) * 10 +
		             digit(time_bytes[3]) - 1900;
		tm.tm_mon = (digit(time_bytes[4]) * 10 + digit(time_bytes[5])) - 1;
		tm.tm_mday = (digit(time_bytes[6]) * 10 + digit(time_bytes[7]));
		tm.tm_hour = (digit(time_bytes[8]) * 10 + digit(time_bytes[9]));
		tm.tm_min = (digit(time_bytes[10]) * 10 + digit(time_bytes[11]));
		tm.tm_sec = (digit(time_bytes[12]) * 10 + digit(time_bytes[13]));
		ts.tv_nsec = (digit(time_bytes[14]) * 10 + digit(time_bytes[15])) *
		             10000000;
		offset = (int8_t) time_bytes[16];
	}
	else
	{
		tm.tm_year = time_bytes[0];
		tm.tm_mon = time_bytes[1] - 1;
		tm.tm_mday = time_bytes[2];
		tm.tm_hour = time_bytes[3];
		tm.tm_min = time_bytes[4];
		tm.tm_sec = time_bytes[5];
		ts.tv_nsec = 0;
		offset = (int8_t) time_bytes[6];
	}
	time_t tz_offset = offset * 15 * 60;
	ts.tv_sec = timegm(&tm) - tz_offset;
	return ts;
}

struct EntryState
{
	const Volume* volume;
	const uint8_t* data;
	size_t data_size;
	uint32_t next_ce_lba;
	uint32_t next_ce_offset;
	uint32_t next_ce_size;
	uint32_t jump_count;
};

static void BeginEntries(struct EntryState* state, const uint8_t* data,
                         size_t data_size, bool is_root, const Volume* volume)
{
	memset(state, 0, sizeof(*state));
	state->volume = volume;
	if ( volume->no_susp )
		return;
	else if ( is_root )
	{
		if ( data_size < 7 )
			return;
		if ( data[0] != 'S' || data[1] != 'P' || data[2] < 7 || data[3] != 1 ||
		     data[4] != 0xBE || data[5] != 0xEF )
			return;
		state->data = data;
		state->data_size = data_size;
	}
	else
	{
		if ( !volume->susp_enabled )
			return;
		if ( data_size < volume->susp_offset )
			return;
		state->data = data + volume->susp_offset;
		state->data_size = data_size - volume->susp_offset;
	}
}

// The continuation area replaces the exhausted System Use area in place, so
// any number of areas are walked without nesting.
static bool ReadEntry(struct EntryState* state,
                      const uint8_t** out_field,
                      uint8_t* out_field_len)
{
	while ( true )
	{
		while ( 4 <= state->data_size )
		{
			const uint8_t* field = state->data;
			uint8_t len = field[2];
			if ( len < 4 || state->data_size < len )
				return errno = EBADMSG, false;
			state->data += len;
			state->data_size -= len;
			if ( field[0] == 'C' && field[1] == 'E' && field[3] == 1 )
			{
				if ( len < 28 )
					return errno = EBADMSG, false;
				if ( !ReadDualEndian32(field + 4, &state->next_ce_lba) ||
				     !ReadDualEndian32(field + 12, &state->next_ce_offset) ||
				     !ReadDualEndian32(field + 20, &state->next_ce_size) )
					return false;
				continue;
			}
			else if ( field[0] == 'S' && field[1] == 'T' && field[3] == 1 )
				break;
			*out_field = field;
			*out_field_len = len;
			return true;
		}
		state->data = NULL;
		state->data_size = 0;
		if ( !state->next_ce_size )
			return errno = 0, false;
		// Drop additional entries after reaching the block limit.
		if ( ISO9660_CE_BLOCK_LIMIT <= state->jump_count++ )
			return errno = 0, false;
		const MemoryMap* map = state->volume->map;
		uint64_t position = (uint64_t) state->next_ce_lba *
		                    ISO9660_SECTOR_SIZE + state->next_ce_offset;
		uint64_t size = state->next_ce_size;
		if ( map->Size() < position || map->Size() - position < size )
			return errno = EBADMSG, false;
		state->data = map->Data() + position;
		state->data_size = (size_t) size;
		state->next_ce_lba = 0;
		state->next_ce_offset = 0;
		state->next_ce_size = 0;
	}
}

static bool Append(char** buffer, size_t* used, size_t* allocated,
                   const char* data, size_t data_size)
{
	if ( *allocated - *used <= data_size )
	{
		size_t new_allocated = *allocated ? *allocated : 64;
		while ( new_allocated - *used <= data_size )
			new_allocated *= 2;
		char* new_buffer = (char*) realloc(*buffer, new_allocated);
		if ( !new_buffer )
			return false;
		*buffer = new_buffer;
		*allocated = new_allocated;
	}
	memcpy(*buffer + *used, data, data_size);
	*used += data_size;
	(*buffer)[*used] = '\0';
	return true;
}

static bool DecodeEntries(const Volume* volume, const uint8_t* data,
                          size_t data_size, bool is_root,
                          DirectoryRecord* record)
{
	StatRecord* st = &record->stat;
	char* name = NULL;
	size_t name_used = 0;
	size_t name_allocated = 0;
	bool append_name = false;
	char* target = NULL;
	size_t target_used = 0;
	size_t target_allocated = 0;
	bool omit_slash = true;
	bool has_serial = false;
	uint32_t serial = 0;
	struct EntryState entry_state;
	BeginEntries(&entry_state, data, data_size, is_root, volume);
	const uint8_t* field;
	uint8_t len;
	bool success = true;
	while ( success && ReadEntry(&entry_state, &field, &len) )
	{
		if ( field[0] == 'S' && field[1] == 'P' && 7 <= len &&
		     field[3] == 1 && field[4] == 0xBE && field[5] == 0xEF )
		{
			record->has_signature = true;
			record->susp_skip = field[6];
			continue;
		}
		if ( volume->no_rock || field[3] != 1 )
			continue;
		if ( field[0] == 'P' && field[1] == 'X' && 36 <= len )
		{
			uint32_t mode, nlink, uid, gid;
			if ( !ReadDualEndian32(field + 4, &mode) ||
			     !ReadDualEndian32(field + 12, &nlink) ||
			     !ReadDualEndian32(field + 20, &uid) ||
			     !ReadDualEndian32(field + 28, &gid) ||
			     (44 <= len && !ReadDualEndian32(field + 36, &serial)) )
			{
				success = false;
				break;
			}
			has_serial = 44 <= len;
			UnpackMode(mode, &st->type, &st->permissions);
			st->hard_link_count = nlink;
			st->user_id = uid;
			st->group_id = gid;
		}
		else if ( field[0] == 'T' && field[1] == 'F' && 5 <= len )
		{
			uint8_t flags = field[4];
			size_t size = flags & ISO9660_TF_LONG_FORM ? 17 : 7;
			const uint8_t* timestamps = field + 5;
			size_t left = len - 5;
			size_t index = 0;
			if ( (flags & ISO9660_TF_CREATION) && size * (index + 1) <= left )
				st->create_time =
					DecodeTimestamp(timestamps + size * index++, flags);
			if ( (flags & ISO9660_TF_MODIFY) && size * (index + 1) <= left )
				st->modify_time =
					DecodeTimestamp(timestamps + size * index++, flags);
			if ( (flags & ISO9660_TF_ACCESS) && size * (index + 1) <= left )
				st->access_time =
					DecodeTimestamp(timestamps + size * index++, flags);
			if ( (flags & ISO9660_TF_ATTRIBUTES) && size * (index + 1) <= left )
				st->status_time =
					DecodeTimestamp(timestamps + size * index++, flags);
		}
		else if ( field[0] == 'N' && field[1] == 'M' && 5 <= len )
		{
			uint8_t nm_flags = field[4];
			if ( !append_name )
				name_used = 0;
			const char* fragment = (const char*) (field + 5);
			size_t fragment_len = len - 5;
			if ( nm_flags & ISO9660_NM_CURRENT )
				fragment = ".", fragment_len = 1;
			else if ( nm_flags & ISO9660_NM_PARENT )
				fragment = "..", fragment_len = 2;
			if ( !Append(&name, &name_used, &name_allocated, fragment,
			             fragment_len) )
				success = false;
			append_name = nm_flags & ISO9660_NM_CONTINUE;
		}
		else if ( field[0] == 'S' && field[1] == 'L' && 5 <= len )
		{
			for ( size_t n = 5; success && n < len && 2 <= len - n; )
			{
				uint8_t comp_flags = field[n + 0];
				uint8_t comp_len = field[n + 1];
				if ( len - (n + 2) < comp_len )
				{
					errno = EBADMSG;
					success = false;
					break;
				}
				const char* comp = (const char*) (field + n + 2);
				n += 2 + comp_len;
				if ( !omit_slash &&
				     !Append(&target, &target_used, &target_allocated, "/", 1) )
					success = false;
				if ( comp_flags & ISO9660_SL_CURRENT )
					comp = ".", comp_len = 1;
				else if ( comp_flags & ISO9660_SL_PARENT )
					comp = "..", comp_len = 2;
				else if ( comp_flags & ISO9660_SL_ROOT )
					comp = "/", comp_len = 1;
				if ( success &&
				     !Append(&target, &target_used, &target_allocated, comp,
				             comp_len) )
					success = false;
				// Older libisofs and genisoimage wrongly set the root bit on
				// non-root components and encode trailing slashes incorrectly.
				// Don't add another slash if the root bit was set.
				omit_slash = comp_flags & (ISO9660_SL_CONTINUE|ISO9660_SL_ROOT);
			}
			if ( !target &&
			     !Append(&target, &target_used, &target_allocated, "", 0) )
				success = false;
		}
		else if ( field[0] == 'C' && field[1] == 'L' && 12 <= len )
		{
			if ( !ReadDualEndian32(field + 4, &record->relocated_sector) )
			{
				success = false;
				break;
			}
			record->relocated = true;
			record->children = true;
			st->type = FILE_TYPE_DIR;
		}
		else if ( field[0] == 'R' && field[1] == 'E' )
			record->hidden = true;
	}
	if ( success && errno )
		success = false;
	if ( success && name )
	{
		free(record->name);
		record->name = name;
		name = NULL;
	}
	if ( success && st->type == FILE_TYPE_SYMLINK )
	{
		if ( !st->SetTarget(target ? target : "") )
			success = false;
		else
			st->size = strlen(st->target);
	}
	if ( success && has_serial )
		st->file_id = serial;
	int errnum = errno;
	free(name);
	free(target);
	errno = errnum;
	return success;
}

bool DecodeRecord(const Volume* volume, uint64_t record_offset,
                  size_t available, bool is_root, DirectoryRecord* record)
{
	const MemoryMap* map = volume->map;
	if ( map->Size() < record_offset ||
	     map->Size() - record_offset < available )
		return errno = EBADMSG, false;
	const uint8_t* data = map->Data() + record_offset;
	if ( available < ISO9660_DIRENT_NAME + 1 )
		return errno = EBADMSG, false;
	uint8_t dirent_len = data[ISO9660_DIRENT_LENGTH];
	uint8_t name_len = data[ISO9660_DIRENT_NAME_LENGTH];
	size_t extended_off = 33 + name_len + !(name_len & 1);
	if ( dirent_len < ISO9660_DIRENT_NAME + 1 || available < dirent_len ||
	     dirent_len < extended_off )
		return errno = EBADMSG, false;
	uint32_t extent;
	uint32_t size;
	if ( !ReadDualEndian32(data + ISO9660_DIRENT_EXTENT, &extent) ||
	     !ReadDualEndian32(data + ISO9660_DIRENT_SIZE, &size) )
		return false;
	uint8_t xattr_len = data[ISO9660_DIRENT_XATTR_LENGTH];
	if ( UINT32_MAX - extent < xattr_len )
		return errno = EBADMSG, false;
	uint8_t file_flags = data[ISO9660_DIRENT_FLAGS];
	bool is_directory = file_flags & ISO9660_DIRENT_FLAG_DIR;
	record->record_offset = record_offset;
	record->sector = extent + xattr_len;
	record->size = size;
	record->hidden = file_flags & ISO9660_DIRENT_FLAG_NO_EXIST;
	record->children = is_directory;
	StatRecord* st = &record->stat;
	st->Reset();
	st->type = is_directory ? FILE_TYPE_DIR : FILE_TYPE_FILE;
	st->permissions = 0555;
	st->size = size;
	st->hard_link_count = 1;
	st->device_id = volume->device_id;
	st->modify_time = DecodeTimestamp(data + ISO9660_DIRENT_DATETIME, 0);
	st->create_time = st->modify_time;
	st->access_time = st->modify_time;
	st->status_time = st->modify_time;
	const char* name_data = (const char*) (data + ISO9660_DIRENT_NAME);
	free(record->name);
	record->is_dot = name_len == 0 || (name_len == 1 && !name_data[0]);
	record->is_dotdot = name_len == 1 && name_data[0] == 1;
	if ( record->is_dot )
		record->name = strdup(".");
	else if ( record->is_dotdot )
		record->name = strdup("..");
	else
	{
		size_t length = 0;
		while ( length < name_len && name_data[length] != ';' )
			length++;
		if ( length < name_len && length && name_data[length - 1] == '.' )
			length--;
		record->name = strndup(name_data, length);
	}
	if ( !record->name )
		return false;
	if ( !DecodeEntries(volume, data + extended_off, dirent_len - extended_off,
	                    is_root, record) )
		return false;
	if ( !record->stat.file_id )
	{
		if ( record->stat.type == FILE_TYPE_DIR )
			record->stat.file_id = (uint64_t) record->sector *
			                       ISO9660_SECTOR_SIZE;
		else
			record->stat.file_id = record_offset;
	}
	return true;
}

} // namespace Pathlab
