// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Memory-mapped files

    Used for reading small configuration files in one shot.
    The mapping stays valid until the owning object goes out of scope.
*/

#pragma once

#include "core.hpp"

namespace lanmeet {


//------------------------------------------------------------------------------
// Memory-mapped file

struct MappedView;

/// This represents a file on disk that will be mapped
struct MappedFile : NoCopy
{
    friend struct MappedView;

    int File = -1;
    uint64_t Length = 0;

    inline bool IsValid() const { return Length != 0; }

    // Opens the file for shared read-only access with other applications
    // Returns false on error (file not found, empty file, etc)
    bool OpenRead(const char* path);

    void Close();

    MappedFile() = default;
    ~MappedFile();
};


//------------------------------------------------------------------------------
// MappedView

/// View of the whole memory mapped file
struct MappedView : NoCopy
{
    void* Map = nullptr;
    uint8_t* Data = nullptr;
    uint32_t Length = 0;

    // Returns false on error
    bool Open(MappedFile* file);

    void Close();

    MappedView() = default;
    ~MappedView();
};


//------------------------------------------------------------------------------
// MappedReadOnlySmallFile

/// Convenience wrapper around MappedFile/MappedView for reading small files
struct MappedReadOnlySmallFile : NoCopy
{
    /// Returns true if the file could be read, or false.
    /// File will be kept open until this object goes out of scope or Close()
    bool Read(const char* path);

    /// Release the file early
    void Close();


    LANMEET_INLINE const uint8_t* GetData() const
    {
        return View.Data;
    }
    LANMEET_INLINE uint32_t GetDataBytes() const
    {
        return View.Length;
    }

    // Ordered so that View goes out of scope first:

    MappedFile File;
    MappedView View;
};


//------------------------------------------------------------------------------
// Helpers

/// Write the provided buffer to the file at the given path
bool WriteBufferToFile(const char* path, const void* data, uint64_t bytes);


} // namespace lanmeet
