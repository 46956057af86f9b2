#ifndef AMQPTX_INTERNAL_EXPORT_HPP
#define AMQPTX_INTERNAL_EXPORT_HPP

/*
 *
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

/// @cond INTERNAL

/// import/export macros
#if defined(_WIN32) && !defined(AMQPTX_DECLARE_STATIC)
  //
  // Import and Export definitions for Windows:
  //
#  define AMQPTX_EXPORT __declspec(dllexport)
#  define AMQPTX_IMPORT __declspec(dllimport)
#  define AMQPTX_CLASS_EXPORT
#  define AMQPTX_CLASS_IMPORT
#else
  //
  // Non-Windows (Linux, etc.) definitions:
  //
#  define AMQPTX_EXPORT __attribute ((visibility ("default")))
#  define AMQPTX_IMPORT
#  define AMQPTX_CLASS_EXPORT __attribute ((visibility ("default")))
#  define AMQPTX_CLASS_IMPORT
#endif

// For amqptx library symbols
#ifdef amqptx_EXPORTS
#  define AMQPTX_EXTERN AMQPTX_EXPORT
#  define AMQPTX_CLASS_EXTERN AMQPTX_CLASS_EXPORT
#else
#  define AMQPTX_EXTERN AMQPTX_IMPORT
#  define AMQPTX_CLASS_EXTERN AMQPTX_CLASS_IMPORT
#endif

/// @endcond

#endif // AMQPTX_INTERNAL_EXPORT_HPP
