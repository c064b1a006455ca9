///// Otter: PCH fuer die Host-App; stabile Include-Reihenfolge; DLL-Import unter Windows.
///// Schneefuchs: Keine impliziten GL-Includes; deterministisch; ASCII-only.
///// Maus: GLEW/GLFW nur hier und in Host-TUs; Kern-Header bleiben GL-frei.
///// Datei: src/pch.hpp

#pragma once

// ======================
// C/C++ Standard (PCH)
// ======================
#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ===============
// Plattform: Win
// ===============
#ifdef _WIN32
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <windows.h>
#endif

// =====================
// OpenGL include order
// =====================
// Verhindert, dass GLFW eigene GL-Header nachlaedt:
#ifndef GLFW_INCLUDE_NONE
  #define GLFW_INCLUDE_NONE
#endif
// GLEW ohne GLU/Imaging (wird nicht benoetigt):
#ifndef GLEW_NO_GLU
  #define GLEW_NO_GLU
#endif

// Reihenfolge: erst GLEW, dann GLFW
#include <GL/glew.h>
#include <GLFW/glfw3.h>
