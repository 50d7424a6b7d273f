// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "core_mmap.hpp"

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

#include <cstdio>

namespace lanmeet {


//------------------------------------------------------------------------------
// MappedFile

// Settings files larger than this are rejected
static const uint64_t kMaxSmallFileBytes = 64 * 1024 * 1024;

MappedFile::~MappedFile()
{
    Close();
}

bool MappedFile::OpenRead(const char* path)
{
    Close();

    File = ::open(path, O_RDONLY);
    if (File == -1) {
        return false;
    }

    const off_t len = ::lseek(File, 0, SEEK_END);
    if (len <= 0 || static_cast<uint64_t>(len) > kMaxSmallFileBytes) {
        Close();
        return false;
    }

    Length = static_cast<uint64_t>(len);
    return true;
}

void MappedFile::Close()
{
    if (File != -1) {
        ::close(File);
        File = -1;
    }

    Length = 0;
}


//------------------------------------------------------------------------------
// MappedView

MappedView::~MappedView()
{
    Close();
}

bool MappedView::Open(MappedFile* file)
{
    Close();

    if (!file || !file->IsValid()) {
        return false;
    }

    void* map = ::mmap(nullptr, file->Length, PROT_READ, MAP_SHARED, file->File, 0);
    if (map == MAP_FAILED) {
        return false;
    }

    Map = map;
    Data = reinterpret_cast<uint8_t*>(map);
    Length = static_cast<uint32_t>(file->Length);
    return true;
}

void MappedView::Close()
{
    if (Map) {
        ::munmap(Map, Length);
        Map = nullptr;
    }

    Data = nullptr;
    Length = 0;
}


//------------------------------------------------------------------------------
// MappedReadOnlySmallFile

bool MappedReadOnlySmallFile::Read(const char* path)
{
    Close();

    if (!File.OpenRead(path)) {
        return false;
    }
    if (!View.Open(&File)) {
        File.Close();
        return false;
    }

    return true;
}

void MappedReadOnlySmallFile::Close()
{
    View.Close();
    File.Close();
}


//------------------------------------------------------------------------------
// Helpers

bool WriteBufferToFile(const char* path, const void* data, uint64_t bytes)
{
    FILE* file = std::fopen(path, "wb");
    if (!file) {
        return false;
    }

    const size_t written = std::fwrite(data, 1, static_cast<size_t>(bytes), file);
    const int close_result = std::fclose(file);

    return written == bytes && close_result == 0;
}


} // namespace lanmeet
