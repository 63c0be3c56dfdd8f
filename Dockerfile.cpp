# Dockerfile for the Dilithium C++20 Implementation
# Uses CMake and OpenSSL for building

FROM ubuntu:24.04

# Prevent interactive prompts
ENV DEBIAN_FRONTEND=noninteractive

# Install build dependencies
RUN apt-get update && apt-get install -y \
    build-essential \
    cmake \
    libssl-dev \
    && rm -rf /var/lib/apt/lists/*

WORKDIR /app

# Copy source code
COPY CMakeLists.txt ./
COPY src/cpp/ ./src/cpp/
COPY tests/cpp/ ./tests/cpp/
COPY examples/cpp/speed_compare.cpp ./examples/cpp/

# Create build directory and build
RUN mkdir -p build && cd build && \
    cmake .. -DCMAKE_BUILD_TYPE=Release && \
    make -j$(nproc)

# Default command runs the full test suite
CMD ["ctest", "--test-dir", "build", "--output-on-failure"]
