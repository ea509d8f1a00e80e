#include "util/Logging.hpp"

Q_LOGGING_CATEGORY(lcCatalog, "qtpptxtemplate.catalog")
Q_LOGGING_CATEGORY(lcRender, "qtpptxtemplate.render")
Q_LOGGING_CATEGORY(lcImage, "qtpptxtemplate.image")
Q_LOGGING_CATEGORY(lcPackage, "qtpptxtemplate.package")
