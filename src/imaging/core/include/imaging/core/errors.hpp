#pragma once

#include <stdexcept>
#include <string>

namespace wellgrid::imaging::core {

//! Base class of every error raised by the well grid pipeline.
class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Malformed or inconsistent parameters. Raised before any image is read.
class ConfigError : public Error {
public:
	using Error::Error;
};

//! The corner geometry cannot be reconciled with the tiling.
class FitError : public Error {
public:
	FitError(const std::string& what, double residual) : Error(what), m_residual{residual} {
	}

	double residual() const noexcept {
		return m_residual;
	} //!< Corner residual in pixels at the time of the failure.

private:
	double m_residual;
};

//! Reading or writing an image, stack or table failed.
class IoError : public Error {
public:
	using Error::Error;
};

//! A stamp stack and its coordinate table do not describe the same wells.
class ManifestError : public Error {
public:
	using Error::Error;
};

} // namespace wellgrid::imaging::core
