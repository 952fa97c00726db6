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
 * isoaccessor.cpp
 * Read-only accessor for ISO 9660 images with Rock Ridge extensions.
 */

#include <errno.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

#include <pathlab/accessor.h>
#include <pathlab/iso9660.h>
#include <pathlab/isoaccessor.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>
#include <pathlab/window.h>

#include "cache.h"
#include "record.h"

namespace Pathlab {

Iso9660Accessor* Iso9660Accessor::Mount(const char* image_path,
                                        const IsoOptions* options)
{
	IsoOptions defaults;
	if ( !options )
		options = &defaults;
	MemoryMap* map = MemoryMap::Open(image_path);
	if ( !map )
		return NULL;
	Iso9660Accessor* accessor = new Iso9660Accessor(map, options);
	map->Unref();
	if ( !accessor->LoadVolume(image_path) )
	{
		int errnum = errno;
		delete accessor;
		return errno = errnum, (Iso9660Accessor*) NULL;
	}
	return accessor;
}

Iso9660Accessor::Iso9660Accessor(MemoryMap* map, const IsoOptions* options)
{
	map->Refer();
	this->map = map;
	this->volume = new Volume;
	this->volume->map = map;
	this->volume->device_id = DeviceId();
	this->volume->susp_enabled = false;
	this->volume->susp_offset = 0;
	this->volume->no_rock = options->no_rock;
	this->volume->no_susp = options->no_susp;
	this->cache = new RecordCache(options->cache_size);
	this->root = NULL;
}

Iso9660Accessor::~Iso9660Accessor()
{
	delete cache;
	if ( root )
		root->Unref();
	delete volume;
	map->Unref();
}

bool Iso9660Accessor::LoadVolume(const char* image_path)
{
	uint64_t image_size = map->Size();
	struct iso9660_pvd pvd;
	for ( uint64_t lba = ISO9660_FIRST_DESCRIPTOR; true; lba++ )
	{
		uint64_t offset = lba * ISO9660_SECTOR_SIZE;
		if ( image_size < offset || image_size - offset < ISO9660_SECTOR_SIZE )
			return Corrupt(image_path);
		const uint8_t* descriptor = map->Data() + offset;
		if ( memcmp(descriptor + 1, "CD001", 5) != 0 )
			return Corrupt(image_path);
		if ( descriptor[0] == TYPE_VOLUME_DESCRIPTOR_SET_TERMINATOR )
			return Corrupt(image_path);
		if ( descriptor[0] == TYPE_PRIMARY_VOLUME_DESCRIPTOR )
		{
			memcpy(&pvd, descriptor, sizeof(pvd));
			break;
		}
	}
	if ( pvd.version != 1 || pvd.file_structure_version != 1 )
		return Corrupt(image_path);
	uint32_t root_lba;
	uint32_t root_size;
	if ( !ReadDualEndian32(pvd.root_dirent + ISO9660_DIRENT_EXTENT,
	                       &root_lba) ||
	     !ReadDualEndian32(pvd.root_dirent + ISO9660_DIRENT_SIZE,
	                       &root_size) )
		return Corrupt(image_path);
	uint64_t root_offset = (uint64_t) root_lba * ISO9660_SECTOR_SIZE;
	if ( image_size <= root_offset )
		return Corrupt(image_path);
	uint64_t available = ISO9660_SECTOR_SIZE;
	if ( image_size - root_offset < available )
		available = image_size - root_offset;
	if ( root_size < available )
		available = root_size;
	DirectoryRecord* record = new DirectoryRecord();
	if ( !DecodeRecord(volume, root_offset, (size_t) available, true, record) )
	{
		int errnum = errno;
		record->Unref();
		return errnum == EBADMSG ? Corrupt(image_path) : (errno = errnum, false);
	}
	if ( !record->is_dot || !record->children )
	{
		record->Unref();
		return Corrupt(image_path);
	}
	if ( record->has_signature && !volume->no_susp )
	{
		volume->susp_enabled = true;
		volume->susp_offset = record->susp_skip;
	}
	root = record;
	return true;
}

size_t Iso9660Accessor::CachedRecords() const
{
	return cache->Count();
}

bool Iso9660Accessor::RockRidge() const
{
	return volume->susp_enabled;
}

bool Iso9660Accessor::NextChild(DirectoryRecord* dir, uint64_t* offset_inout,
                                DirectoryRecord** child_out)
{
	uint64_t offset = *offset_inout;
	uint64_t start = (uint64_t) dir->sector * ISO9660_SECTOR_SIZE;
	while ( true )
	{
		*offset_inout = offset;
		if ( dir->size <= offset )
			return errno = 0, false;
		uint64_t position = start + offset;
		if ( map->Size() <= position )
			return errno = EBADMSG, false;
		uint64_t sector_left = ISO9660_SECTOR_SIZE -
		                       position % ISO9660_SECTOR_SIZE;
		const uint8_t* data = map->Data() + position;
		// Records never cross a sector, the rest of it is padding.
		if ( !data[0] )
		{
			offset += sector_left;
			continue;
		}
		uint64_t available = sector_left;
		if ( dir->size - offset < available )
			available = dir->size - offset;
		if ( map->Size() - position < available )
			available = map->Size() - position;
		offset += data[0] + (data[0] & 1);
		*offset_inout = offset;
		DirectoryRecord* child = new DirectoryRecord();
		if ( !DecodeRecord(volume, position, (size_t) available, false, child) )
			return child->Unref(), false;
		if ( child->is_dot || child->is_dotdot || child->hidden )
		{
			child->Unref();
			continue;
		}
		if ( child->relocated )
		{
			uint64_t real_offset = (uint64_t) child->relocated_sector *
			                       ISO9660_SECTOR_SIZE;
			if ( map->Size() <= real_offset )
				return child->Unref(), errno = EBADMSG, false;
			uint64_t real_available = map->Size() - real_offset;
			if ( ISO9660_SECTOR_SIZE < real_available )
				real_available = ISO9660_SECTOR_SIZE;
			DirectoryRecord* real = new DirectoryRecord();
			if ( !DecodeRecord(volume, real_offset, (size_t) real_available,
			                   false, real) )
				return child->Unref(), real->Unref(), false;
			free(real->name);
			real->name = child->name;
			child->name = NULL;
			child->Unref();
			child = real;
		}
		*child_out = child;
		return true;
	}
}

DirectoryRecord* Iso9660Accessor::FindChild(DirectoryRecord* dir,
                                            const char* name)
{
	uint64_t offset = 0;
	DirectoryRecord* child;
	while ( NextChild(dir, &offset, &child) )
	{
		if ( !strcmp(child->name, name) )
			return child;
		child->Unref();
	}
	return NULL;
}

DirectoryRecord* Iso9660Accessor::GetRecord(const char* resolved_path)
{
	if ( IsRootPath(resolved_path) )
		return root->Refer(), root;
	if ( DirectoryRecord* cached = cache->Get(resolved_path) )
		return cached;
	char* parent_path = ParentPath(resolved_path);
	if ( !parent_path )
		return NULL;
	DirectoryRecord* parent = GetRecord(parent_path);
	if ( !parent )
		return free(parent_path), (DirectoryRecord*) NULL;
	if ( !parent->children )
	{
		NotADirectory(parent_path);
		parent->Unref();
		return free(parent_path), (DirectoryRecord*) NULL;
	}
	DirectoryRecord* record = FindChild(parent, BaseName(resolved_path));
	parent->Unref();
	free(parent_path);
	if ( !record )
	{
		if ( !errno )
			NotFound(resolved_path);
		else if ( errno == EBADMSG )
			Corrupt(resolved_path);
		return NULL;
	}
	cache->Put(resolved_path, record);
	return record;
}

bool Iso9660Accessor::Lookup(const char* resolved_path, StatRecord* st)
{
	DirectoryRecord* record = GetRecord(resolved_path);
	if ( !record )
		return false;
	bool result = st->CopyFrom(&record->stat);
	record->Unref();
	return result;
}

char** Iso9660Accessor::ListDir(const char* path, size_t* count_out)
{
	char* resolved = ResolvePath(path, true, true);
	if ( !resolved )
		return NULL;
	DirectoryRecord* dir = GetRecord(resolved);
	if ( !dir )
		return free(resolved), (char**) NULL;
	if ( !dir->children )
	{
		NotADirectory(path);
		dir->Unref();
		return free(resolved), (char**) NULL;
	}
	char** names = NULL;
	size_t count = 0;
	size_t allocated = 0;
	uint64_t offset = 0;
	DirectoryRecord* child;
	bool success = true;
	while ( success && NextChild(dir, &offset, &child) )
	{
		if ( count == allocated )
		{
			size_t new_allocated = allocated ? 2 * allocated : 16;
			char** new_names = (char**)
				reallocarray(names, new_allocated, sizeof(char*));
			if ( !new_names )
				success = false;
			else
				names = new_names, allocated = new_allocated;
		}
		if ( success && !(names[count] = strdup(child->name)) )
			success = false;
		else if ( success )
			count++;
		child->Unref();
	}
	dir->Unref();
	if ( !success || errno )
	{
		int errnum = errno;
		FreeNames(names, count);
		if ( errnum == EBADMSG )
			Corrupt(resolved);
		else
			errno = errnum;
		return free(resolved), (char**) NULL;
	}
	free(resolved);
	if ( !names && !(names = (char**) malloc(sizeof(char*))) )
		return NULL;
	*count_out = count;
	return names;
}

Stream* Iso9660Accessor::Open(const char* path, int mode, int buffering)
{
	if ( buffering != -1 )
		return NotSupported(path), (Stream*) NULL;
	if ( mode != OPEN_READ )
		return NotSupported(path), (Stream*) NULL;
	char* resolved = ResolvePath(path, true, true);
	if ( !resolved )
		return NULL;
	DirectoryRecord* record = GetRecord(resolved);
	free(resolved);
	if ( !record )
		return NULL;
	if ( record->stat.type == FILE_TYPE_DIR )
	{
		record->Unref();
		return IsADirectory(path), (Stream*) NULL;
	}
	MemoryWindowStream* stream =
		MemoryWindowStream::Create(map, (uint64_t) record->sector *
		                                ISO9660_SECTOR_SIZE, record->size);
	record->Unref();
	if ( !stream )
		return Corrupt(path), (Stream*) NULL;
	return stream;
}

} // namespace Pathlab
