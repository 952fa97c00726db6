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
 * pathlab/archive.h
 * Accessors projecting ZIP and TAR archives onto a directory tree.
 */

#ifndef INCLUDE_PATHLAB_ARCHIVE_H
#define INCLUDE_PATHLAB_ARCHIVE_H

#include <stddef.h>
#include <stdint.h>

#include <pathlab/accessor.h>

struct archive;
struct archive_entry;

namespace Pathlab {

class Stream;
class ArchiveMember;
struct ArchiveEdit;

static const size_t MEMBER_HASH_LENGTH = 1 << 10;

class ArchiveAccessor : public Accessor
{
protected:
	ArchiveAccessor(char* archive_path);

public:
	virtual ~ArchiveAccessor();

public:
	virtual Stream* Open(const char* path, int mode, int buffering = -1);
	virtual char** ListDir(const char* path, size_t* count_out);
	virtual bool Create(const char* path, const StatRecord* st,
	                    Stream* content);
	virtual bool Move(const char* path, const char* dest);
	virtual bool Delete(const char* path);
	virtual bool Chmod(const char* path, uint32_t mode,
	                   bool follow_symlinks = true);

public:
	const char* ArchivePath() const { return archive_path; }
	size_t MemberCount() const { return members_used; }
	bool Reload();

protected:
	virtual bool Lookup(const char* resolved_path, StatRecord* st);
	virtual bool SupportReadFormat(struct archive* reader) = 0;
	virtual bool SetWriteFormat(struct archive* writer) = 0;

private:
	void ClearIndex();
	ArchiveMember* FindMember(const char* path);
	bool InsertMember(ArchiveMember* member);
	bool ImplyDirectories(const char* path);
	bool HasChildren(const char* path);
	bool IndexEntry(struct archive_entry* entry, size_t index,
	                int64_t position);
	struct archive* OpenReader();
	bool ReadMember(const ArchiveMember* member, uint8_t** data_out,
	                size_t* size_out);
	bool WriteImpliedDirectories(struct archive* writer,
	                             const ArchiveEdit* edit);
	bool CopyMembers(struct archive* writer, const ArchiveEdit* edit);
	bool Rewrite(const ArchiveEdit* edit);

private:
	char* archive_path;
	ArchiveMember** members;
	size_t members_used;
	size_t members_allocated;
	ArchiveMember* hash_members[MEMBER_HASH_LENGTH];

};

class ZipAccessor : public ArchiveAccessor
{
public:
	static ZipAccessor* Mount(const char* archive_path);

private:
	ZipAccessor(char* archive_path) : ArchiveAccessor(archive_path) { }

protected:
	virtual bool SupportReadFormat(struct archive* reader);
	virtual bool SetWriteFormat(struct archive* writer);

};

class TarAccessor : public ArchiveAccessor
{
public:
	static TarAccessor* Mount(const char* archive_path);

private:
	TarAccessor(char* archive_path) : ArchiveAccessor(archive_path) { }

protected:
	virtual bool SupportReadFormat(struct archive* reader);
	virtual bool SetWriteFormat(struct archive* writer);

};

} // namespace Pathlab

#endif
