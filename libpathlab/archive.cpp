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
 * archive.cpp
 * Accessors projecting ZIP and TAR archives onto a directory tree.
 */

#include <sys/stat.h>
#include <sys/types.h>

#include <archive.h>
#include <archive_entry.h>
#include <errno.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <pathlab/accessor.h>
#include <pathlab/archive.h>
#include <pathlab/creator.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>
#include <pathlab/stream.h>

namespace Pathlab {

static const size_t ARCHIVE_BLOCK_SIZE = 10240;
static const uint64_t ROOT_FILE_ID = 1;
static const size_t NO_HEADER = SIZE_MAX;

enum EditKind
{
	EDIT_CREATE,
	EDIT_DELETE,
	EDIT_MOVE,
	EDIT_CHMOD,
};

enum EditAction
{
	ACTION_KEEP,
	ACTION_DROP,
	ACTION_RENAME,
	ACTION_CHMOD,
};

struct ArchiveEdit
{
	int kind;
	const char* path;
	const char* dest;
	const StatRecord* st;
	Stream* content;
	uint32_t mode;
};

class ArchiveMember
{
public:
	ArchiveMember();
	~ArchiveMember();

private:
	ArchiveMember(const ArchiveMember&);
	ArchiveMember& operator=(const ArchiveMember&);

public:
	ArchiveMember* next_hashed;
	char* path;
	char* raw_name; // As stored in the archive, NULL for implied directories.
	char* link_path;
	size_t index;
	StatRecord stat;

};

ArchiveMember::ArchiveMember()
{
	this->next_hashed = NULL;
	this->path = NULL;
	this->raw_name = NULL;
	this->link_path = NULL;
	this->index = NO_HEADER;
}

ArchiveMember::~ArchiveMember()
{
	free(path);
	free(raw_name);
	free(link_path);
}

static int ArchiveErrno(struct archive* a)
{
	int errnum = archive_errno(a);
	return 0 < errnum ? errnum : EIO;
}

static bool IsWithin(const char* path, const char* base)
{
	if ( IsRootPath(base) )
		return true;
	size_t length = strlen(base);
	return !strncmp(path, base, length) &&
	       (path[length] == '\0' || path[length] == '/');
}

static bool IsChildOf(const char* path, const char* dir)
{
	if ( IsRootPath(path) )
		return false;
	size_t parent_length = strrchr(path, '/') - path;
	if ( IsRootPath(dir) )
		return parent_length == 0;
	return strlen(dir) == parent_length && !strncmp(path, dir, parent_length);
}

static int ActionOf(const char* path, const ArchiveEdit* edit)
{
	switch ( edit->kind )
	{
	case EDIT_CREATE:
	case EDIT_DELETE:
		return !strcmp(path, edit->path) ? ACTION_DROP : ACTION_KEEP;
	case EDIT_MOVE:
		if ( IsWithin(path, edit->path) )
			return ACTION_RENAME;
		return IsWithin(path, edit->dest) ? ACTION_DROP : ACTION_KEEP;
	case EDIT_CHMOD:
		return !strcmp(path, edit->path) ? ACTION_CHMOD : ACTION_KEEP;
	}
	return ACTION_KEEP;
}

// Returns the stored name of a renamed member, without the leading slash.
static char* RenamedName(const char* path, const ArchiveEdit* edit, bool is_dir)
{
	char* renamed;
	if ( asprintf(&renamed, is_dir ? "%s%s/" : "%s%s", edit->dest + 1,
	              path + strlen(edit->path)) < 0 )
		return NULL;
	return renamed;
}

static struct timespec MakeTime(time_t sec, long nsec)
{
	struct timespec ts;
	ts.tv_sec = sec;
	ts.tv_nsec = nsec;
	return ts;
}

static bool WriteMember(struct archive* writer, const char* path,
                        const StatRecord* st, Stream* content)
{
	int type = st->type == FILE_TYPE_LINK ? FILE_TYPE_FILE : st->type;
	uint8_t* data = NULL;
	ssize_t size = 0;
	if ( content && type == FILE_TYPE_FILE )
	{
		if ( content->Seek(0, SEEK_SET) < 0 )
			return false;
		if ( (size = content->ReadAll(&data)) < 0 )
			return false;
	}
	char* stored;
	if ( asprintf(&stored, type == FILE_TYPE_DIR ? "%s/" : "%s", path + 1) < 0 )
		return free(data), false;
	struct archive_entry* entry = archive_entry_new();
	if ( !entry )
		return free(stored), free(data), errno = ENOMEM, false;
	archive_entry_copy_pathname(entry, stored);
	archive_entry_set_mode(entry, PackMode(type, st->permissions));
	archive_entry_set_size(entry, type == FILE_TYPE_FILE ? size : 0);
	archive_entry_set_uid(entry, st->user_id);
	archive_entry_set_gid(entry, st->group_id);
	if ( st->user[0] )
		archive_entry_copy_uname(entry, st->user);
	if ( st->group[0] )
		archive_entry_copy_gname(entry, st->group);
	struct timespec mtime = st->modify_time;
	if ( !mtime.tv_sec && !mtime.tv_nsec )
		clock_gettime(CLOCK_REALTIME, &mtime);
	archive_entry_set_mtime(entry, mtime.tv_sec, mtime.tv_nsec);
	if ( type == FILE_TYPE_SYMLINK )
		archive_entry_copy_symlink(entry, st->target ? st->target : "");
	bool success = true;
	if ( archive_write_header(writer, entry) < ARCHIVE_WARN )
		errno = ArchiveErrno(writer), success = false;
	if ( success && size &&
	     archive_write_data(writer, data, (size_t) size) < 0 )
		errno = ArchiveErrno(writer), success = false;
	int errnum = errno;
	archive_entry_free(entry);
	free(stored);
	free(data);
	errno = errnum;
	return success;
}

ArchiveAccessor::ArchiveAccessor(char* archive_path)
{
	this->archive_path = archive_path;
	this->members = NULL;
	this->members_used = 0;
	this->members_allocated = 0;
	for ( size_t i = 0; i < MEMBER_HASH_LENGTH; i++ )
		this->hash_members[i] = NULL;
}

ArchiveAccessor::~ArchiveAccessor()
{
	ClearIndex();
	free(members);
	free(archive_path);
}

void ArchiveAccessor::ClearIndex()
{
	for ( size_t i = 0; i < members_used; i++ )
		delete members[i];
	members_used = 0;
	for ( size_t i = 0; i < MEMBER_HASH_LENGTH; i++ )
		hash_members[i] = NULL;
}

ArchiveMember* ArchiveAccessor::FindMember(const char* path)
{
	size_t bin = HashPath(path) % MEMBER_HASH_LENGTH;
	for ( ArchiveMember* iter = hash_members[bin]; iter;
	      iter = iter->next_hashed )
		if ( !strcmp(iter->path, path) )
			return iter;
	return NULL;
}

// A later member with the same path replaces the earlier one.
bool ArchiveAccessor::InsertMember(ArchiveMember* member)
{
	if ( ArchiveMember* existing = FindMember(member->path) )
	{
		free(existing->raw_name);
		existing->raw_name = member->raw_name;
		member->raw_name = NULL;
		free(existing->link_path);
		existing->link_path = member->link_path;
		member->link_path = NULL;
		existing->index = member->index;
		bool result = existing->stat.CopyFrom(&member->stat);
		delete member;
		return result;
	}
	if ( members_used == members_allocated )
	{
		size_t new_allocated = members_allocated ? 2 * members_allocated : 64;
		ArchiveMember** new_members = (ArchiveMember**)
			reallocarray(members, new_allocated, sizeof(ArchiveMember*));
		if ( !new_members )
			return delete member, false;
		members = new_members;
		members_allocated = new_allocated;
	}
	members[members_used++] = member;
	size_t bin = HashPath(member->path) % MEMBER_HASH_LENGTH;
	member->next_hashed = hash_members[bin];
	hash_members[bin] = member;
	return true;
}

bool ArchiveAccessor::ImplyDirectories(const char* path)
{
	char* parent = ParentPath(path);
	while ( true )
	{
		if ( !parent )
			return false;
		if ( IsRootPath(parent) || FindMember(parent) )
			return free(parent), true;
		ArchiveMember* dir = new ArchiveMember();
		dir->path = parent;
		dir->stat.type = FILE_TYPE_DIR;
		dir->stat.permissions = 0755;
		dir->stat.hard_link_count = 1;
		dir->stat.device_id = DeviceId();
		if ( !InsertMember(dir) )
			return false;
		parent = ParentPath(dir->path);
	}
}

bool ArchiveAccessor::HasChildren(const char* path)
{
	for ( size_t i = 0; i < members_used; i++ )
		if ( IsChildOf(members[i]->path, path) )
			return true;
	return false;
}

struct archive* ArchiveAccessor::OpenReader()
{
	struct archive* reader = archive_read_new();
	if ( !reader )
		return errno = ENOMEM, (struct archive*) NULL;
	if ( !SupportReadFormat(reader) ||
	     archive_read_open_filename(reader, archive_path,
	                                ARCHIVE_BLOCK_SIZE) != ARCHIVE_OK )
	{
		int errnum = ArchiveErrno(reader);
		archive_read_free(reader);
		return errno = errnum, (struct archive*) NULL;
	}
	return reader;
}

bool ArchiveAccessor::IndexEntry(struct archive_entry* entry, size_t index,
                                 int64_t position)
{
	const char* raw = archive_entry_pathname(entry);
	if ( !raw || !raw[0] )
		return true;
	char* path = NormalizePath(raw);
	if ( !path )
		return false;
	if ( IsRootPath(path) )
		return free(path), true;
	ArchiveMember* member = new ArchiveMember();
	member->path = path;
	member->index = index;
	if ( !(member->raw_name = strdup(raw)) )
		return delete member, false;
	StatRecord* st = &member->stat;
	const char* hardlink = archive_entry_hardlink(entry);
	if ( hardlink )
	{
		st->type = FILE_TYPE_LINK;
		if ( !(member->link_path = NormalizePath(hardlink)) )
			return delete member, false;
	}
	else if ( raw[strlen(raw) - 1] == '/' )
		st->type = FILE_TYPE_DIR;
	else
	{
		uint32_t unused;
		UnpackMode(archive_entry_filetype(entry), &st->type, &unused);
	}
	st->permissions = archive_entry_perm(entry) & PATHLAB_S_IPERM;
	if ( archive_entry_size_is_set(entry) && st->type != FILE_TYPE_DIR )
		st->size = (uint64_t) archive_entry_size(entry);
	st->user_id = archive_entry_uid(entry);
	st->group_id = archive_entry_gid(entry);
	st->SetUser(archive_entry_uname(entry));
	st->SetGroup(archive_entry_gname(entry));
	st->modify_time = MakeTime(archive_entry_mtime(entry),
	                           archive_entry_mtime_nsec(entry));
	st->access_time = archive_entry_atime_is_set(entry) ?
		MakeTime(archive_entry_atime(entry), archive_entry_atime_nsec(entry)) :
		st->modify_time;
	st->status_time = archive_entry_ctime_is_set(entry) ?
		MakeTime(archive_entry_ctime(entry), archive_entry_ctime_nsec(entry)) :
		st->modify_time;
	st->create_time = archive_entry_birthtime_is_set(entry) ?
		MakeTime(archive_entry_birthtime(entry),
		         archive_entry_birthtime_nsec(entry)) :
		st->modify_time;
	st->hard_link_count = archive_entry_nlink(entry);
	if ( !st->hard_link_count )
		st->hard_link_count = 1;
	st->device_id = DeviceId();
	st->file_id = (uint64_t) position + 2;
	if ( st->type == FILE_TYPE_SYMLINK )
	{
		const char* target = archive_entry_symlink(entry);
		if ( !st->SetTarget(target ? target : "") )
			return delete member, false;
		st->size = strlen(st->target);
	}
	if ( !ImplyDirectories(path) )
		return delete member, false;
	return InsertMember(member);
}

bool ArchiveAccessor::Reload()
{
	ClearIndex();
	ArchiveMember* root = new ArchiveMember();
	if ( !(root->path = strdup("/")) )
		return delete root, false;
	root->stat.type = FILE_TYPE_DIR;
	root->stat.permissions = 0755;
	root->stat.hard_link_count = 1;
	root->stat.device_id = DeviceId();
	root->stat.file_id = ROOT_FILE_ID;
	if ( !InsertMember(root) )
		return false;
	// The archive is created by the first write.
	struct stat st;
	if ( stat(archive_path, &st) < 0 )
		return errno == ENOENT;
	struct archive* reader = OpenReader();
	if ( !reader )
		return false;
	struct archive_entry* entry;
	bool success = true;
	for ( size_t index = 0; success; index++ )
	{
		int status = archive_read_next_header(reader, &entry);
		if ( status == ARCHIVE_EOF )
			break;
		if ( status < ARCHIVE_WARN )
		{
			errno = ArchiveErrno(reader);
			success = false;
			break;
		}
		success = IndexEntry(entry, index, archive_read_header_position(reader));
	}
	int errnum = errno;
	archive_read_free(reader);
	if ( !success )
		return errno = errnum, false;
	for ( size_t i = 0; i < members_used; i++ )
	{
		ArchiveMember* member = members[i];
		if ( member->stat.type != FILE_TYPE_LINK || !member->link_path )
			continue;
		ArchiveMember* target = FindMember(member->link_path);
		if ( target && target->stat.type != FILE_TYPE_LINK )
			member->stat.size = target->stat.size;
	}
	return true;
}

bool ArchiveAccessor::Lookup(const char* resolved_path, StatRecord* st)
{
	ArchiveMember* member = FindMember(resolved_path);
	if ( !member )
		return NotFound(resolved_path);
	return st->CopyFrom(&member->stat);
}

char** ArchiveAccessor::ListDir(const char* path, size_t* count_out)
{
	char* resolved = ResolvePath(path, true, true);
	if ( !resolved )
		return NULL;
	ArchiveMember* dir = FindMember(resolved);
	if ( !dir )
		return free(resolved), NotFound(path), (char**) NULL;
	if ( dir->stat.type != FILE_TYPE_DIR )
		return free(resolved), NotADirectory(path), (char**) NULL;
	char** names = (char**) reallocarray(NULL, members_used + 1,
	                                     sizeof(char*));
	if ( !names )
		return free(resolved), (char**) NULL;
	size_t count = 0;
	for ( size_t i = 0; i < members_used; i++ )
	{
		if ( !IsChildOf(members[i]->path, resolved) )
			continue;
		if ( !(names[count] = strdup(BaseName(members[i]->path))) )
			return FreeNames(names, count), free(resolved), (char**) NULL;
		count++;
	}
	free(resolved);
	*count_out = count;
	return names;
}

bool ArchiveAccessor::ReadMember(const ArchiveMember* member,
                                 uint8_t** data_out, size_t* size_out)
{
	struct archive* reader = OpenReader();
	if ( !reader )
		return false;
	struct archive_entry* entry;
	for ( size_t index = 0; true; index++ )
	{
		int status = archive_read_next_header(reader, &entry);
		if ( status == ARCHIVE_EOF )
			return archive_read_free(reader), errno = ESTALE, false;
		if ( status < ARCHIVE_WARN )
		{
			int errnum = ArchiveErrno(reader);
			archive_read_free(reader);
			return errno = errnum, false;
		}
		if ( index == member->index )
			break;
	}
	uint8_t* data = NULL;
	size_t used = 0;
	size_t allocated = 0;
	while ( true )
	{
		if ( used == allocated )
		{
			size_t new_allocated = allocated ? 2 * allocated : 4096;
			uint8_t* new_data = (uint8_t*) realloc(data, new_allocated);
			if ( !new_data )
				return free(data), archive_read_free(reader),
				       errno = ENOMEM, false;
			data = new_data;
			allocated = new_allocated;
		}
		la_ssize_t amount = archive_read_data(reader, data + used,
		                                      allocated - used);
		if ( amount < 0 )
		{
			int errnum = ArchiveErrno(reader);
			free(data);
			archive_read_free(reader);
			return errno = errnum, false;
		}
		if ( !amount )
			break;
		used += amount;
	}
	archive_read_free(reader);
	*data_out = data;
	*size_out = used;
	return true;
}

Stream* ArchiveAccessor::Open(const char* path, int mode, int buffering)
{
	if ( buffering != -1 )
		return NotSupported(path), (Stream*) NULL;
	if ( mode == OPEN_WRITE )
		return Creator::Open(this, path, TARGET_IGNORE, PARENT_RAISE);
	if ( mode != OPEN_READ )
		return errno = EINVAL, (Stream*) NULL;
	char* resolved = ResolvePath(path, true, true);
	if ( !resolved )
		return NULL;
	ArchiveMember* member = FindMember(resolved);
	free(resolved);
	for ( size_t hops = 0; member && member->stat.type == FILE_TYPE_LINK;
	      hops++ )
	{
		if ( SYMLINK_FOLLOW_MAX <= hops || !member->link_path )
			member = NULL;
		else
			member = FindMember(member->link_path);
	}
	if ( !member )
		return NotFound(path), (Stream*) NULL;
	if ( member->stat.type == FILE_TYPE_DIR )
		return IsADirectory(path), (Stream*) NULL;
	uint8_t* data = NULL;
	size_t size = 0;
	if ( member->index != NO_HEADER && !ReadMember(member, &data, &size) )
		return NULL;
	BufferStream* stream = new BufferStream(false);
	stream->Adopt(data, size);
	return stream;
}

bool ArchiveAccessor::WriteImpliedDirectories(struct archive* writer,
                                              const ArchiveEdit* edit)
{
	for ( size_t i = 0; i < members_used; i++ )
	{
		ArchiveMember* member = members[i];
		if ( member->raw_name || IsRootPath(member->path) )
			continue;
		int action = ActionOf(member->path, edit);
		if ( action == ACTION_DROP )
			continue;
		StatRecord st;
		if ( !st.CopyFrom(&member->stat) )
			return false;
		if ( action == ACTION_CHMOD )
			st.permissions = edit->mode;
		bool success;
		if ( action == ACTION_RENAME )
		{
			char* renamed;
			if ( asprintf(&renamed, "%s%s", edit->dest,
			              member->path + strlen(edit->path)) < 0 )
				return false;
			success = WriteMember(writer, renamed, &st, NULL);
			free(renamed);
		}
		else
			success = WriteMember(writer, member->path, &st, NULL);
		if ( !success )
			return false;
	}
	return true;
}

bool ArchiveAccessor::CopyMembers(struct archive* writer,
                                  const ArchiveEdit* edit)
{
	struct archive* reader = OpenReader();
	if ( !reader )
		return false;
	struct archive_entry* entry;
	uint8_t buffer[16384];
	bool success = true;
	while ( success )
	{
		int status = archive_read_next_header(reader, &entry);
		if ( status == ARCHIVE_EOF )
			break;
		if ( status < ARCHIVE_WARN )
		{
			errno = ArchiveErrno(reader);
			success = false;
			break;
		}
		const char* raw = archive_entry_pathname(entry);
		if ( !raw )
			raw = "";
		char* path = NormalizePath(raw);
		if ( !path )
		{
			success = false;
			break;
		}
		int action = ActionOf(path, edit);
		if ( action == ACTION_DROP )
		{
			free(path);
			continue;
		}
		if ( action == ACTION_RENAME )
		{
			bool is_dir = (raw[0] && raw[strlen(raw) - 1] == '/') ||
			              archive_entry_filetype(entry) == AE_IFDIR;
			char* renamed = RenamedName(path, edit, is_dir);
			if ( !renamed )
			{
				free(path);
				success = false;
				break;
			}
			archive_entry_copy_pathname(entry, renamed);
			free(renamed);
		}
		else if ( action == ACTION_CHMOD )
			archive_entry_set_perm(entry, edit->mode);
		free(path);
		const char* hardlink = archive_entry_hardlink(entry);
		if ( hardlink && edit->kind == EDIT_MOVE )
		{
			char* link_path = NormalizePath(hardlink);
			if ( !link_path )
			{
				success = false;
				break;
			}
			if ( IsWithin(link_path, edit->path) )
			{
				char* renamed = RenamedName(link_path, edit, false);
				if ( renamed )
					archive_entry_copy_hardlink(entry, renamed);
				else
					success = false;
				free(renamed);
			}
			free(link_path);
			if ( !success )
				break;
		}
		if ( archive_write_header(writer, entry) < ARCHIVE_WARN )
		{
			errno = ArchiveErrno(writer);
			success = false;
			break;
		}
		while ( true )
		{
			la_ssize_t amount = archive_read_data(reader, buffer,
			                                      sizeof(buffer));
			if ( amount < 0 )
			{
				errno = ArchiveErrno(reader);
				success = false;
				break;
			}
			if ( !amount )
				break;
			if ( archive_write_data(writer, buffer, (size_t) amount) < 0 )
			{
				errno = ArchiveErrno(writer);
				success = false;
				break;
			}
		}
	}
	int errnum = errno;
	archive_read_free(reader);
	errno = errnum;
	return success;
}

// The container formats have no in-place update, so every change writes a
// new archive beside the old one and renames it over.
bool ArchiveAccessor::Rewrite(const ArchiveEdit* edit)
{
	struct stat original;
	bool existed = stat(archive_path, &original) == 0;
	if ( !existed && errno != ENOENT )
		return false;
	char* temp_path;
	if ( asprintf(&temp_path, "%s.XXXXXX", archive_path) < 0 )
		return false;
	int fd = mkstemp(temp_path);
	if ( fd < 0 )
		return free(temp_path), false;
	mode_t mode = existed ? original.st_mode & 07777 : 0644;
	bool success = fchmod(fd, mode) == 0;
	struct archive* writer = archive_write_new();
	if ( success && !writer )
		errno = ENOMEM, success = false;
	if ( success && (!SetWriteFormat(writer) ||
	                 archive_write_open_fd(writer, fd) != ARCHIVE_OK) )
		errno = ArchiveErrno(writer), success = false;
	if ( success )
		success = WriteImpliedDirectories(writer, edit);
	if ( success && existed )
		success = CopyMembers(writer, edit);
	if ( success && edit->kind == EDIT_CREATE )
		success = WriteMember(writer, edit->path, edit->st, edit->content);
	if ( success && archive_write_close(writer) != ARCHIVE_OK )
		errno = ArchiveErrno(writer), success = false;
	int errnum = errno;
	if ( writer )
		archive_write_free(writer);
	if ( close(fd) < 0 && success )
		errnum = errno, success = false;
	if ( success && rename(temp_path, archive_path) < 0 )
		errnum = errno, success = false;
	if ( !success )
		unlink(temp_path);
	free(temp_path);
	if ( !success )
		return errno = errnum, false;
	return Reload();
}

bool ArchiveAccessor::Create(const char* path, const StatRecord* st,
                             Stream* content)
{
	char* target = ResolveParent(path);
	if ( !target )
		return false;
	if ( IsRootPath(target) )
		return free(target), AlreadyExists(path);
	ArchiveMember* existing = FindMember(target);
	if ( existing && existing->stat.type == FILE_TYPE_DIR )
	{
		free(target);
		if ( st->type == FILE_TYPE_DIR )
			return AlreadyExists(path);
		return IsADirectory(path);
	}
	ArchiveEdit edit;
	memset(&edit, 0, sizeof(edit));
	edit.kind = EDIT_CREATE;
	edit.path = target;
	edit.st = st;
	edit.content = content;
	bool result = Rewrite(&edit);
	free(target);
	return result;
}

bool ArchiveAccessor::Delete(const char* path)
{
	char* target = ResolveParent(path);
	if ( !target )
		return false;
	ArchiveMember* member = FindMember(target);
	bool result;
	if ( !member )
		result = NotFound(path);
	else if ( IsRootPath(target) )
		result = PermissionDenied(path);
	else if ( member->stat.type == FILE_TYPE_DIR && HasChildren(target) )
		result = errno = ENOTEMPTY, false;
	else
	{
		ArchiveEdit edit;
		memset(&edit, 0, sizeof(edit));
		edit.kind = EDIT_DELETE;
		edit.path = target;
		result = Rewrite(&edit);
	}
	free(target);
	return result;
}

bool ArchiveAccessor::Move(const char* path, const char* dest)
{
	char* source = ResolveParent(path);
	if ( !source )
		return false;
	char* destination = ResolveParent(dest);
	if ( !destination )
		return free(source), false;
	ArchiveMember* member = FindMember(source);
	ArchiveMember* existing = FindMember(destination);
	bool result;
	if ( !member )
		result = NotFound(path);
	else if ( IsRootPath(source) || IsRootPath(destination) )
		result = PermissionDenied(path);
	else if ( !strcmp(source, destination) )
		result = true;
	else if ( IsWithin(destination, source) )
		result = errno = EINVAL, false;
	else if ( existing && existing->stat.type == FILE_TYPE_DIR &&
	          member->stat.type != FILE_TYPE_DIR )
		result = IsADirectory(dest);
	else if ( existing && existing->stat.type != FILE_TYPE_DIR &&
	          member->stat.type == FILE_TYPE_DIR )
		result = NotADirectory(dest);
	else if ( existing && existing->stat.type == FILE_TYPE_DIR &&
	          HasChildren(destination) )
		result = errno = ENOTEMPTY, false;
	else
	{
		ArchiveEdit edit;
		memset(&edit, 0, sizeof(edit));
		edit.kind = EDIT_MOVE;
		edit.path = source;
		edit.dest = destination;
		result = Rewrite(&edit);
	}
	free(source);
	free(destination);
	return result;
}

bool ArchiveAccessor::Chmod(const char* path, uint32_t mode,
                            bool follow_symlinks)
{
	char* target = ResolvePath(path, follow_symlinks, true);
	if ( !target )
		return false;
	ArchiveMember* member = FindMember(target);
	bool result;
	if ( !member )
		result = NotFound(path);
	else if ( IsRootPath(target) )
		result = NotSupported(path);
	else
	{
		ArchiveEdit edit;
		memset(&edit, 0, sizeof(edit));
		edit.kind = EDIT_CHMOD;
		edit.path = target;
		edit.mode = mode & PATHLAB_S_IPERM;
		result = Rewrite(&edit);
	}
	free(target);
	return result;
}

ZipAccessor* ZipAccessor::Mount(const char* archive_path)
{
	char* copy = strdup(archive_path);
	if ( !copy )
		return NULL;
	ZipAccessor* accessor = new ZipAccessor(copy);
	if ( !accessor->Reload() )
	{
		int errnum = errno;
		delete accessor;
		return errno = errnum, (ZipAccessor*) NULL;
	}
	return accessor;
}

bool ZipAccessor::SupportReadFormat(struct archive* reader)
{
	return archive_read_support_format_empty(reader) == ARCHIVE_OK &&
	       archive_read_support_format_zip_seekable(reader) == ARCHIVE_OK;
}

bool ZipAccessor::SetWriteFormat(struct archive* writer)
{
	return archive_write_set_format_zip(writer) == ARCHIVE_OK;
}

TarAccessor* TarAccessor::Mount(const char* archive_path)
{
	char* copy = strdup(archive_path);
	if ( !copy )
		return NULL;
	TarAccessor* accessor = new TarAccessor(copy);
	if ( !accessor->Reload() )
	{
		int errnum = errno;
		delete accessor;
		return errno = errnum, (TarAccessor*) NULL;
	}
	return accessor;
}

bool TarAccessor::SupportReadFormat(struct archive* reader)
{
	return archive_read_support_filter_all(reader) == ARCHIVE_OK &&
	       archive_read_support_format_empty(reader) == ARCHIVE_OK &&
	       archive_read_support_format_tar(reader) == ARCHIVE_OK;
}

bool TarAccessor::SetWriteFormat(struct archive* writer)
{
	return archive_write_set_format_pax_restricted(writer) == ARCHIVE_OK;
}

} // namespace Pathlab
