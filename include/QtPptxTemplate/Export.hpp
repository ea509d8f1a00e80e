/** \file Export.hpp
 *  Symbol visibility macro for shared builds.
 */
#pragma once
#include <QtCore/qglobal.h>

#if defined(QTPPTXTEMPLATE_STATIC)
#  define QTPPTXTEMPLATE_EXPORT
#elif defined(QTPPTXTEMPLATE_BUILD)
#  define QTPPTXTEMPLATE_EXPORT Q_DECL_EXPORT
#else
#  define QTPPTXTEMPLATE_EXPORT Q_DECL_IMPORT
#endif
