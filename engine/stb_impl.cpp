/**
 * @file stb_impl.cpp
 * @brief Implementation file for stb_image and stb_image_write
 *
 * This file contains the implementation of the stb image libraries used
 * for texture loading and image output. It must be compiled as part of
 * the I/O library.
 */

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
