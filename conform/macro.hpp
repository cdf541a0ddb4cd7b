#ifndef CONFORM_MACRO_HPP
#define CONFORM_MACRO_HPP

// Throw-site capture for conform::error::Exception and its THROW_* macros.
#define CONFORM_FILE_NAME __FILE__
#define CONFORM_FILE_LINE __LINE__
#define CONFORM_FUNC_NAME __func__

#endif  // CONFORM_MACRO_HPP
